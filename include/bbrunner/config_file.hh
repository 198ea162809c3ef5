#pragma once

#include <bbrunner/concat_tostr.hh>
#include <bbrunner/file_path.hh>
#include <bbrunner/string_transform.hh>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Parses configuration files in format:
//   # comment
//   name: value
//   name2 = 'single quoted '' string'
//   name3: "double quoted\tstring"
//   array: [a, 'b', "c"]
//   multiline_array: [
//       a # comment
//       b
//   ]
class ConfigFile {
public:
    class ParseError : public std::runtime_error {
        std::string diagnostics_;

    public:
        template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
        ParseError(size_t line, size_t col, Args&&... msg)
        : runtime_error(concat_tostr("line ", line, ':', col, ": ", std::forward<Args>(msg)...)) {}

        ParseError(const ParseError&) = default;
        ParseError(ParseError&&) noexcept = default;
        ParseError& operator=(const ParseError&) = default;
        ParseError& operator=(ParseError&&) noexcept = default;
        ~ParseError() override = default;

        // The offending line with a '^' marker beneath the faulty position
        [[nodiscard]] const std::string& diagnostics() const noexcept { return diagnostics_; }

        friend class ConfigFile;
    };

    class Variable {
        static constexpr uint8_t SET = 1;
        static constexpr uint8_t ARRAY = 2;

        uint8_t flag_ = 0;
        std::string str_;
        std::vector<std::string> arr_;

        void unset() noexcept {
            flag_ = 0;
            str_.clear();
            arr_.clear();
        }

    public:
        // User-provided, so that null_var below can be initialized inside ConfigFile
        Variable() {} // NOLINT(modernize-use-equals-default)

        [[nodiscard]] bool is_set() const noexcept { return flag_ & SET; }

        [[nodiscard]] bool is_array() const noexcept { return flag_ & ARRAY; }

        // Returns true for "1", "on", "true", "yes" (case-sensitive)
        [[nodiscard]] bool as_bool() const noexcept {
            return str_ == "1" || str_ == "on" || str_ == "true" || str_ == "yes";
        }

        template <class T>
        [[nodiscard]] std::optional<T> as() const noexcept {
            return str2num<T>(str_);
        }

        // Empty if the variable is an array or is not set
        [[nodiscard]] const std::string& as_string() const noexcept { return str_; }

        // Empty if the variable is not an array or is not set
        [[nodiscard]] const std::vector<std::string>& as_array() const noexcept { return arr_; }

        friend class ConfigFile;
    };

private:
    std::map<std::string, Variable, std::less<>> vars_;
    static inline const Variable null_var{};

public:
    // Adds variables @p names to the variable set, ignores duplicates
    template <class... Args>
    void add_vars(Args&&... names) {
        (vars_.try_emplace(std::string{std::forward<Args>(names)}), ...);
    }

    // Returns variable @p name or an unset variable if @p name is not in the variable set
    const Variable& operator[](std::string_view name) const noexcept {
        auto it = vars_.find(name);
        return it == vars_.end() ? null_var : it->second;
    }

    [[nodiscard]] const std::map<std::string, Variable, std::less<>>& get_vars() const noexcept {
        return vars_;
    }

    // Loads variables from file @p path. Throws std::runtime_error on I/O error and ParseError on
    // invalid contents.
    void load_config_from_file(FilePath path, bool load_all = false);

    // Loads variables from @p config. If @p load_all is false, variables outside the variable
    // set are parsed and ignored. Throws ParseError on error.
    void load_config_from_string(std::string config, bool load_all = false);
};
