#include "batchdl/resume_planner.hpp"

namespace batchdl {

ResumePlan planResume(const std::filesystem::path& destination, const RemoteInfo& remote, std::error_code& ec) {
    ResumePlan plan;
    ec.clear();

    const auto file_status = std::filesystem::status(destination, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            ec.clear();
        }
        return plan;
    }
    if (!std::filesystem::exists(file_status)) {
        return plan;
    }
    if (!std::filesystem::is_regular_file(file_status)) {
        ec = std::make_error_code(std::filesystem::is_directory(file_status) ? std::errc::is_a_directory
                                                                             : std::errc::invalid_argument);
        return plan;
    }

    const auto size = std::filesystem::file_size(destination, ec);
    if (ec) {
        return plan;
    }
    plan.local_size = static_cast<std::uint64_t>(size);

    if (!remote.content_length) {
        return plan;
    }

    const std::uint64_t total = *remote.content_length;
    if (plan.local_size >= total) {
        plan.already_complete = true;
        plan.truncate = false;
        plan.offset = plan.local_size;
        return plan;
    }

    if (remote.accepts_ranges && plan.local_size > 0) {
        plan.offset = plan.local_size;
        plan.truncate = false;
    }
    return plan;
}

} // namespace batchdl
