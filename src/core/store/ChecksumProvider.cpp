/**
 * ChecksumProvider.cpp
 */

#include "ChecksumProvider.hpp"
#include "../Logger.hpp"
#include "../../utils/HashUtils.hpp"
#include "../../utils/StringUtils.hpp"

namespace wum::core::store {

std::string HashChecksumProvider::compute(const std::filesystem::path& file) {
    std::string digest = m_algorithm == ChecksumAlgorithm::Sha256
        ? utils::HashUtils::sha256File(file.string())
        : utils::HashUtils::sha1File(file.string());

    if (digest.empty()) {
        Logger::instance().warn("Could not checksum {}", file.string());
    }
    return digest;
}

ChecksumAlgorithm HashChecksumProvider::parseAlgorithm(const std::string& name, ChecksumAlgorithm fallback) {
    auto lower = utils::StringUtils::toLower(utils::StringUtils::trim(name));
    if (lower == "sha1" || lower == "sha-1") return ChecksumAlgorithm::Sha1;
    if (lower == "sha256" || lower == "sha-256") return ChecksumAlgorithm::Sha256;
    return fallback;
}

} // namespace wum::core::store
