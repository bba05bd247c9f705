#pragma once

/**
 * ChecksumProvider.hpp
 *
 * Content digests for artifacts and device copies.
 */

#include <filesystem>
#include <string>

namespace wum::core::store {

class ChecksumProvider {
public:
    virtual ~ChecksumProvider() = default;

    /**
     * Digest of a file's content
     * @return Lowercase hex digest, empty if the file could not be read
     */
    virtual std::string compute(const std::filesystem::path& file) = 0;
};

enum class ChecksumAlgorithm {
    Sha1,
    Sha256
};

/**
 * HashChecksumProvider - OpenSSL-backed SHA-1 / SHA-256
 */
class HashChecksumProvider : public ChecksumProvider {
public:
    explicit HashChecksumProvider(ChecksumAlgorithm algorithm = ChecksumAlgorithm::Sha1)
        : m_algorithm(algorithm) {}

    std::string compute(const std::filesystem::path& file) override;

    ChecksumAlgorithm algorithm() const { return m_algorithm; }

    static ChecksumAlgorithm parseAlgorithm(const std::string& name,
                                            ChecksumAlgorithm fallback = ChecksumAlgorithm::Sha1);

private:
    ChecksumAlgorithm m_algorithm;
};

} // namespace wum::core::store
