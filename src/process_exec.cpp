#include "ism/process_exec.hpp"

#include "ism/utility.hpp"

#include <format>
#include <reproc++/run.hpp>
#include <string>
#include <utility>
#include <vector>

namespace imagesmith {

Result<int> process_exec(std::vector<std::string> &&args, std::optional<std::string> working_dir,
                         std::chrono::milliseconds deadline) {
    if (args.empty()) {
        return fail(ErrorKind::InvalidArgument, "Cannot execute empty command");
    }

    reproc::options options;
    options.redirect.out.type = reproc::redirect::parent;
    options.redirect.err.type = reproc::redirect::parent;

    if (working_dir) {
        options.working_directory = working_dir->c_str();
    }

    if (deadline > std::chrono::milliseconds::zero()) {
        options.deadline = reproc::milliseconds(deadline.count());
        options.stop.first = {reproc::stop::wait, reproc::deadline};
        options.stop.second = {reproc::stop::terminate, reproc::milliseconds(5000)};
        options.stop.third = {reproc::stop::kill, reproc::milliseconds(2000)};
    }

    const auto started = std::chrono::steady_clock::now();
    auto [status, ec] = reproc::run(args, options);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    bool expired = deadline > std::chrono::milliseconds::zero() && elapsed >= deadline;
    if (ec == std::errc::timed_out || (expired && status != 0)) {
        return fail(ErrorKind::Timeout,
                    std::format("'{}' exceeded its deadline of {} ms", args.front(), deadline.count()));
    }
    if (ec) {
        return fail(ErrorKind::BuildError, std::format("Failed to run '{}': {}", args.front(), ec.message()));
    }
    return status;
}

} // namespace imagesmith
