/**
 * HttpTransferSource.cpp
 */

#include "HttpTransferSource.hpp"
#include "../Logger.hpp"
#include "../../utils/StringUtils.hpp"

#include <cpr/cpr.h>
#include <fstream>

namespace wum::core::transfer {

namespace fs = std::filesystem;

HttpTransferSource::HttpTransferSource(HttpSourceOptions options)
    : m_options(std::move(options)) {
}

std::string HttpTransferSource::urlFor(const std::string& id) const {
    return utils::StringUtils::replaceAll(m_options.urlTemplate, "{id}", id);
}

FetchOutcome HttpTransferSource::classifyStatus(long statusCode) {
    const std::string message = "HTTP " + std::to_string(statusCode);

    if (statusCode >= 200 && statusCode < 300) {
        return FetchOutcome::success();
    }
    if (statusCode == 404 || statusCode == 410) {
        return FetchOutcome::failure(FetchStatus::NonRecoverable, FailureKind::NotFound, message);
    }
    if (statusCode == 401 || statusCode == 403) {
        return FetchOutcome::failure(FetchStatus::NonRecoverable, FailureKind::AuthenticationRequired, message);
    }
    if (statusCode == 408 || statusCode == 429 || statusCode >= 500) {
        return FetchOutcome::failure(FetchStatus::Recoverable, FailureKind::TransientServerError, message);
    }
    if (statusCode == 0) {
        return FetchOutcome::failure(FetchStatus::Recoverable, FailureKind::NetworkError, "No response");
    }
    return FetchOutcome::failure(FetchStatus::NonRecoverable, FailureKind::NotFound, message);
}

FetchOutcome HttpTransferSource::fetch(const std::string& id,
                                       const fs::path& destination,
                                       const FetchProgressCallback& progress) {
    const std::string url = urlFor(id);

    std::ofstream file(destination, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return FetchOutcome::failure(FetchStatus::Recoverable, FailureKind::IoError,
                                     "Failed to open " + destination.string());
    }

    bool aborted = false;
    int64_t received = 0;
    int64_t expected = 0;

    Logger::instance().debug("GET {}", url);

    cpr::Response response = cpr::Download(
        file,
        cpr::Url{url},
        cpr::Timeout{std::chrono::duration_cast<std::chrono::milliseconds>(m_options.timeout)},
        cpr::VerifySsl{m_options.verifySsl},
        cpr::Header{
            {"User-Agent", m_options.userAgent},
            {"Referer", m_options.referer}
        },
        cpr::ProgressCallback([&](cpr::cpr_off_t downloadTotal, cpr::cpr_off_t downloadNow,
                                  cpr::cpr_off_t uploadTotal, cpr::cpr_off_t uploadNow,
                                  intptr_t userdata) -> bool {
            received = static_cast<int64_t>(downloadNow);
            expected = static_cast<int64_t>(downloadTotal);

            std::optional<int64_t> total;
            if (downloadTotal > 0) {
                total = static_cast<int64_t>(downloadTotal);
            }
            if (progress && !progress(received, total)) {
                aborted = true;
                return false;
            }
            return true;
        })
    );

    file.close();
    const bool writeFailed = file.fail();

    if (aborted) {
        return FetchOutcome::failure(FetchStatus::Recoverable, FailureKind::NetworkError, "Transfer aborted");
    }

    if (writeFailed) {
        std::error_code ec;
        auto space = fs::space(destination.parent_path(), ec);
        if (!ec && space.available == 0) {
            return FetchOutcome::failure(FetchStatus::NonRecoverable, FailureKind::DiskFull,
                                         "No space left for " + destination.string());
        }
        return FetchOutcome::failure(FetchStatus::Recoverable, FailureKind::IoError,
                                     "Write failed for " + destination.string());
    }

    if (response.error) {
        if (response.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
            return FetchOutcome::failure(FetchStatus::Recoverable, FailureKind::NetworkTimeout,
                                         response.error.message);
        }
        return FetchOutcome::failure(FetchStatus::Recoverable, FailureKind::NetworkError,
                                     response.error.message);
    }

    FetchOutcome outcome = classifyStatus(response.status_code);
    if (outcome.status != FetchStatus::Success) {
        return outcome;
    }

    if (expected > 0 && received < expected) {
        return FetchOutcome::failure(FetchStatus::Recoverable, FailureKind::PartialTransfer,
            "Received " + std::to_string(received) + " of " + std::to_string(expected) + " bytes");
    }

    Logger::instance().debug("Fetched {} ({} bytes)", url, received);
    return outcome;
}

} // namespace wum::core::transfer
