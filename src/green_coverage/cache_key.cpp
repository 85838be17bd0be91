#include "green_coverage/cache_key.hpp"

#include <array>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <openssl/evp.h>

#include "green_coverage/errors.hpp"

namespace green_coverage {

namespace {

constexpr std::size_t k_file_chunk_bytes{64 * 1024};

struct DigestContextDeleter final {
    void operator()(EVP_MD_CTX* context) const noexcept {
        EVP_MD_CTX_free(context);
    }
};

using DigestContextPtr = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

/**
 * @brief Incremental SHA-256 over OpenSSL EVP.
 */
class Sha256 final {
  public:
    Sha256()
        : context_(EVP_MD_CTX_new()) {
        if (context_ == nullptr || EVP_DigestInit_ex(context_.get(), EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("Unable to initialize SHA-256 digest");
        }
    }

    void update(const void* data, std::size_t size) {
        if (EVP_DigestUpdate(context_.get(), data, size) != 1) {
            throw std::runtime_error("SHA-256 update failed");
        }
    }

    std::string hex_digest() {
        std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
        unsigned int digest_size = 0;
        if (EVP_DigestFinal_ex(context_.get(), digest.data(), &digest_size) != 1) {
            throw std::runtime_error("SHA-256 finalization failed");
        }
        std::string hex;
        hex.reserve(static_cast<std::size_t>(digest_size) * 2);
        for (unsigned int index = 0; index < digest_size; ++index) {
            hex += fmt::format("{:02x}", digest[index]);
        }
        return hex;
    }

  private:
    DigestContextPtr context_;
};

// nlohmann::json objects are std::map backed, so members dump sorted.
nlohmann::json to_document(const KeyParams& params) {
    nlohmann::json document = nlohmann::json::object();
    for (const auto& [name, value] : params.values()) {
        document[name] = std::visit([](const auto& alternative) { return nlohmann::json(alternative); }, value);
    }
    return document;
}

}  // namespace

KeyParams& KeyParams::set(std::string name, std::int64_t value) {
    map_values_.insert_or_assign(std::move(name), Value{value});
    return *this;
}

KeyParams& KeyParams::set(std::string name, int value) {
    return set(std::move(name), static_cast<std::int64_t>(value));
}

KeyParams& KeyParams::set(std::string name, double value) {
    map_values_.insert_or_assign(std::move(name), Value{value});
    return *this;
}

KeyParams& KeyParams::set(std::string name, bool value) {
    map_values_.insert_or_assign(std::move(name), Value{value});
    return *this;
}

KeyParams& KeyParams::set(std::string name, std::string value) {
    map_values_.insert_or_assign(std::move(name), Value{std::move(value)});
    return *this;
}

KeyParams& KeyParams::set(std::string name, const char* value) {
    return set(std::move(name), std::string{value});
}

KeyParams& KeyParams::set_file_digest(std::string name, const std::filesystem::path& path) {
    return set(std::move(name), file_sha256_hex(path));
}

const std::map<std::string, KeyParams::Value>& KeyParams::values() const noexcept {
    return map_values_;
}

bool KeyParams::empty() const noexcept {
    return map_values_.empty();
}

std::string KeyParams::canonical() const {
    return to_document(*this).dump();
}

std::string sha256_hex(std::string_view data) {
    Sha256 digest{};
    digest.update(data.data(), data.size());
    return digest.hex_digest();
}

std::string file_sha256_hex(const std::filesystem::path& path) {
    std::ifstream stream{path, std::ios::binary};
    if (!stream) {
        throw CoverageError(ErrorKind::MissingInput, "Cannot read file for hashing: " + path.string());
    }
    Sha256 digest{};
    std::vector<char> chunk(k_file_chunk_bytes);
    while (stream) {
        stream.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        const std::streamsize read_count = stream.gcount();
        if (read_count > 0) {
            digest.update(chunk.data(), static_cast<std::size_t>(read_count));
        }
    }
    if (stream.bad()) {
        throw CoverageError(ErrorKind::MissingInput, "I/O error while hashing " + path.string());
    }
    return digest.hex_digest();
}

std::string derive_cache_key(const CalculationType& type, const KeyParams& params) {
    nlohmann::json document = nlohmann::json::object();
    document["calculation_type"] = type.name();
    document["params"] = to_document(params);
    return sha256_hex(document.dump());
}

}  // namespace green_coverage
