/**
 * @file python_driver.hpp
 * @brief The in-interpreter driver and the request file it reads.
 * @author CodeVerdict contributors
 *
 * The driver is passed to the interpreter with -c. It reads the request file
 * from the scratch directory, removes it, compiles and runs the candidate in
 * a fresh namespace, evaluates each assertion against that namespace and
 * reports every step on the report channel (fd 3).
 *
 * Evaluation happens on a second thread that hands its results to the main
 * thread through a queue. Only the main thread knows the session token; it
 * relays results in the expected order and turns anything out of order into
 * a ReportTampering runtime error. An audit hook refuses frame and object
 * graph introspection to every thread but the main one.
 */

#pragma once

#include "core/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace code_verdict {

/// File name of the request inside the scratch directory.
inline constexpr std::string_view kRequestFileName = "request.hex";

/// Python source of the driver.
[[nodiscard]] std::string_view python_driver_source() noexcept;

struct DriverRequest {
    std::string token;
    std::string code;
    std::vector<std::string> assertions;
    bool guard_environment{true};
};

/**
 * @brief Write @p request into @p scratch_dir.
 *
 * Format: one line per item, each hex encoded: token, guard flag ("1"/"0"),
 * code, then the assertions in order.
 */
[[nodiscard]] Result<void> write_request_file(const std::filesystem::path& scratch_dir,
                                              const DriverRequest& request);

/// Random 128-bit token in hex, unique per execution.
[[nodiscard]] std::string make_session_token();

}  // namespace code_verdict
