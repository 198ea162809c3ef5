#pragma once

#include <bbrunner/sandbox/sandbox.hh>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace bbrunner {

// Filesystem view of a single sandbox: bind mounts of host paths at their own paths, applied in
// order inside a private mount namespace
class SandboxHandle {
public:
    struct BindMount {
        std::string path;
        bool read_only;
        bool skip_if_missing;
    };

private:
    std::vector<BindMount> bind_mounts_;
    std::vector<sandbox::RequestOptions::LinuxNamespaces::Mount::BindMount> mount_operations_;

public:
    explicit SandboxHandle(std::vector<BindMount> bind_mounts);

    SandboxHandle(const SandboxHandle&) = delete;
    SandboxHandle(SandboxHandle&&) noexcept = default;
    SandboxHandle& operator=(const SandboxHandle&) = delete;
    SandboxHandle& operator=(SandboxHandle&&) noexcept = default;
    ~SandboxHandle() = default;

    [[nodiscard]] const std::vector<BindMount>& bind_mounts() const noexcept {
        return bind_mounts_;
    }

    // Refers to bind_mounts()
    [[nodiscard]] std::span<const sandbox::RequestOptions::LinuxNamespaces::Mount::BindMount>
    mount_operations() const noexcept {
        return mount_operations_;
    }
};

class SandboxBuilder {
public:
    SandboxBuilder() = default;
    SandboxBuilder(const SandboxBuilder&) = default;
    SandboxBuilder(SandboxBuilder&&) = default;
    SandboxBuilder& operator=(const SandboxBuilder&) = default;
    SandboxBuilder& operator=(SandboxBuilder&&) = default;
    virtual ~SandboxBuilder() = default;

    // Makes @p root_path read-only, then entries of @p writable_allow_list that exist writable,
    // then @p task_areas writable. Throws RunError SANDBOX_SETUP_ERROR if @p root_path or any of
    // @p task_areas is not an existing directory.
    [[nodiscard]] virtual SandboxHandle build(
        std::string_view root_path,
        std::span<const std::string> writable_allow_list,
        std::span<const std::string> task_areas
    ) const = 0;
};

class LinuxSandboxBuilder : public SandboxBuilder {
public:
    [[nodiscard]] SandboxHandle build(
        std::string_view root_path,
        std::span<const std::string> writable_allow_list,
        std::span<const std::string> task_areas
    ) const override;
};

} // namespace bbrunner
