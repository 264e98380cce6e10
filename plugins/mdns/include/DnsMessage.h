#pragma once

/**
 * @file DnsMessage.h
 * @brief Minimal DNS wire codec for multicast DNS-SD queries and responses
 *
 * Names are carried in presentation form: labels joined with '.', with a
 * literal dot inside a label written as "\." and other unprintable bytes as
 * "\ddd". UTF-8 bytes pass through unchanged.
 */

#include "Result.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace LanScout::Mdns {

enum RecordType : std::uint16_t {
    TYPE_A = 1,
    TYPE_PTR = 12,
    TYPE_TXT = 16,
    TYPE_AAAA = 28,
    TYPE_SRV = 33,
    TYPE_ANY = 255
};

constexpr std::uint16_t CLASS_IN = 1;
constexpr std::uint16_t CLASS_UNICAST_RESPONSE = 0x8000;  ///< QU bit in a question
constexpr std::uint16_t CLASS_CACHE_FLUSH = 0x8000;       ///< same bit in a record
constexpr std::uint16_t FLAG_RESPONSE = 0x8000;

constexpr std::size_t MAX_NAME_LENGTH = 255;
constexpr std::size_t MAX_LABEL_LENGTH = 63;

struct DnsQuestion {
    std::string name;
    std::uint16_t type{TYPE_PTR};
    bool unicastResponse{false};
};

/**
 * @brief One resource record; only the fields of its type are filled in
 */
struct DnsRecord {
    std::string name;
    std::uint16_t type{0};
    std::uint16_t rrClass{CLASS_IN};
    bool cacheFlush{false};
    std::uint32_t ttl{0};

    std::string target;                 ///< PTR target or SRV target
    std::uint16_t priority{0};          ///< SRV
    std::uint16_t weight{0};            ///< SRV
    std::uint16_t port{0};              ///< SRV
    std::vector<std::string> txt;       ///< TXT strings
    std::string address;                ///< A / AAAA in text form
};

struct DnsMessage {
    std::uint16_t id{0};
    std::uint16_t flags{0};
    std::vector<DnsQuestion> questions;
    std::vector<DnsRecord> answers;
    std::vector<DnsRecord> authorities;
    std::vector<DnsRecord> additionals;

    bool isResponse() const { return (flags & FLAG_RESPONSE) != 0; }

    /// Answers, authorities and additionals in wire order
    std::vector<const DnsRecord*> allRecords() const;

    /**
     * @brief Decode a datagram.
     *
     * Rejects truncated headers, out-of-bounds lengths and compression
     * pointer loops. Records of unknown type are kept with only the common
     * fields set.
     */
    static Result<DnsMessage> parse(const std::uint8_t* data, std::size_t length);
    static Result<DnsMessage> parse(const std::vector<std::uint8_t>& bytes) {
        return parse(bytes.data(), bytes.size());
    }
};

/**
 * @brief Build a query datagram (id 0, no flags) for the given questions.
 */
Result<std::vector<std::uint8_t>> encodeQuery(const std::vector<DnsQuestion>& questions);
Result<std::vector<std::uint8_t>> encodeQuery(const std::string& name, std::uint16_t type,
                                              bool unicastResponse = false);

/**
 * @brief Split a presentation-form name into raw labels, decoding escapes.
 * @return std::nullopt on a malformed escape or an empty inner label
 */
std::optional<std::vector<std::string>> splitLabels(const std::string& name);

/// Escape a raw label for use inside a presentation-form name
std::string escapeLabel(const std::string& label);

/// Lowercase ASCII letters and drop trailing dots; the key for name lookups
std::string canonicalName(const std::string& name);

/**
 * @brief "Office Pi._ssh._tcp.local." split into its DNS-SD parts
 */
struct InstanceName {
    std::string label;    ///< "Office Pi" with escapes decoded
    std::string type;     ///< "_ssh._tcp."
    std::string domain;   ///< "local."
};

/**
 * @return std::nullopt when `fqdn` has no "_service._proto" pair or no
 *         instance label in front of it
 */
std::optional<InstanceName> splitInstanceName(const std::string& fqdn);

/// Inverse of splitInstanceName
std::string joinInstanceName(const std::string& label, const std::string& type, const std::string& domain);

} // namespace LanScout::Mdns
