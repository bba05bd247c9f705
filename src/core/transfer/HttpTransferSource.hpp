#pragma once

/**
 * HttpTransferSource.hpp
 *
 * Fetches catalog items over HTTP(S) with cpr.
 */

#include "TransferSource.hpp"

#include <chrono>
#include <string>

namespace wum::core::transfer {

struct HttpSourceOptions {
    // "{id}" is replaced by the catalog id
    std::string urlTemplate{"https://download2.vimm.net/download/?mediaId={id}"};
    std::string referer{"https://vimm.net/"};
    std::string userAgent;
    std::chrono::seconds timeout{3600};
    bool verifySsl{true};
};

/**
 * HttpTransferSource - default TransferSource
 */
class HttpTransferSource : public TransferSource {
public:
    explicit HttpTransferSource(HttpSourceOptions options);

    FetchOutcome fetch(const std::string& id,
                       const std::filesystem::path& destination,
                       const FetchProgressCallback& progress) override;

    /**
     * Download URL of a catalog id
     */
    std::string urlFor(const std::string& id) const;

    /**
     * Map a final HTTP status to an outcome (2xx = success)
     */
    static FetchOutcome classifyStatus(long statusCode);

private:
    HttpSourceOptions m_options;
};

} // namespace wum::core::transfer
