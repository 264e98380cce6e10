#include "DnsMessage.h"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <cctype>
#include <cstdio>

namespace LanScout::Mdns {

namespace {

constexpr std::size_t HEADER_SIZE = 12;
constexpr int MAX_POINTER_JUMPS = 16;

std::uint16_t read16(const std::uint8_t* p) {
    return static_cast<std::uint16_t>((p[0] << 8) | p[1]);
}

std::uint32_t read32(const std::uint8_t* p) {
    return (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16) |
           (static_cast<std::uint32_t>(p[2]) << 8) | static_cast<std::uint32_t>(p[3]);
}

void write16(std::vector<std::uint8_t>& out, std::uint16_t value) {
    out.push_back(static_cast<std::uint8_t>(value >> 8));
    out.push_back(static_cast<std::uint8_t>(value & 0xFF));
}

std::string withTrailingDot(std::string name) {
    if (name.empty() || name.back() != '.') {
        name += '.';
    }
    return name;
}

// Reads a possibly compressed name starting at `offset`; on success `offset`
// points past the name as it appears in place.
std::optional<std::string> readName(const std::uint8_t* data, std::size_t length, std::size_t& offset) {
    std::string out;
    std::size_t pos = offset;
    std::size_t wireLength = 1;
    bool jumped = false;
    int jumps = 0;

    while (true) {
        if (pos >= length) {
            return std::nullopt;
        }
        const std::uint8_t labelLength = data[pos];

        if (labelLength == 0) {
            if (!jumped) {
                offset = pos + 1;
            }
            break;
        }

        if ((labelLength & 0xC0) == 0xC0) {
            if (pos + 1 >= length) {
                return std::nullopt;
            }
            const std::size_t target = (static_cast<std::size_t>(labelLength & 0x3F) << 8) | data[pos + 1];
            if (!jumped) {
                offset = pos + 2;
            }
            jumped = true;
            if (++jumps > MAX_POINTER_JUMPS || target >= length) {
                return std::nullopt;
            }
            pos = target;
            continue;
        }

        if ((labelLength & 0xC0) != 0) {
            return std::nullopt;
        }

        ++pos;
        if (pos + labelLength > length) {
            return std::nullopt;
        }
        wireLength += labelLength + 1u;
        if (wireLength > MAX_NAME_LENGTH) {
            return std::nullopt;
        }
        if (!out.empty()) {
            out += '.';
        }
        out += escapeLabel(std::string(reinterpret_cast<const char*>(data + pos), labelLength));
        pos += labelLength;
    }

    return out.empty() ? std::string(".") : out;
}

bool appendName(std::vector<std::uint8_t>& out, const std::string& name) {
    auto labels = splitLabels(name);
    if (!labels) {
        return false;
    }
    std::size_t wireLength = 1;
    for (const auto& label : *labels) {
        if (label.empty() || label.size() > MAX_LABEL_LENGTH) {
            return false;
        }
        wireLength += label.size() + 1;
        if (wireLength > MAX_NAME_LENGTH) {
            return false;
        }
        out.push_back(static_cast<std::uint8_t>(label.size()));
        out.insert(out.end(), label.begin(), label.end());
    }
    out.push_back(0);
    return true;
}

bool readRecord(const std::uint8_t* data, std::size_t length, std::size_t& offset, DnsRecord& record) {
    auto name = readName(data, length, offset);
    if (!name || offset + 10 > length) {
        return false;
    }
    record.name = *name;
    record.type = read16(data + offset);
    const std::uint16_t rrClass = read16(data + offset + 2);
    record.cacheFlush = (rrClass & CLASS_CACHE_FLUSH) != 0;
    record.rrClass = rrClass & 0x7FFF;
    record.ttl = read32(data + offset + 4);
    const std::size_t rdLength = read16(data + offset + 8);
    const std::size_t rdStart = offset + 10;
    const std::size_t rdEnd = rdStart + rdLength;
    if (rdEnd > length) {
        return false;
    }

    switch (record.type) {
        case TYPE_PTR: {
            std::size_t p = rdStart;
            auto target = readName(data, length, p);
            if (!target) {
                return false;
            }
            record.target = *target;
            break;
        }
        case TYPE_SRV: {
            if (rdLength < 7) {
                return false;
            }
            record.priority = read16(data + rdStart);
            record.weight = read16(data + rdStart + 2);
            record.port = read16(data + rdStart + 4);
            std::size_t p = rdStart + 6;
            auto target = readName(data, length, p);
            if (!target) {
                return false;
            }
            record.target = *target;
            break;
        }
        case TYPE_TXT: {
            std::size_t p = rdStart;
            while (p < rdEnd) {
                const std::size_t n = data[p++];
                if (p + n > rdEnd) {
                    return false;
                }
                if (n > 0) {
                    record.txt.emplace_back(reinterpret_cast<const char*>(data + p), n);
                }
                p += n;
            }
            break;
        }
        case TYPE_A: {
            if (rdLength != 4) {
                return false;
            }
            char text[INET_ADDRSTRLEN] = {0};
            if (inet_ntop(AF_INET, data + rdStart, text, sizeof(text)) == nullptr) {
                return false;
            }
            record.address = text;
            break;
        }
        case TYPE_AAAA: {
            if (rdLength != 16) {
                return false;
            }
            char text[INET6_ADDRSTRLEN] = {0};
            if (inet_ntop(AF_INET6, data + rdStart, text, sizeof(text)) == nullptr) {
                return false;
            }
            record.address = text;
            break;
        }
        default:
            break;
    }

    offset = rdEnd;
    return true;
}

bool readSection(const std::uint8_t* data, std::size_t length, std::size_t& offset,
                 std::uint16_t count, std::vector<DnsRecord>& section) {
    section.reserve(count);
    for (std::uint16_t i = 0; i < count; ++i) {
        DnsRecord record;
        if (!readRecord(data, length, offset, record)) {
            return false;
        }
        section.push_back(std::move(record));
    }
    return true;
}

} // namespace

std::vector<const DnsRecord*> DnsMessage::allRecords() const {
    std::vector<const DnsRecord*> out;
    out.reserve(answers.size() + authorities.size() + additionals.size());
    for (const auto* section : {&answers, &authorities, &additionals}) {
        for (const auto& record : *section) {
            out.push_back(&record);
        }
    }
    return out;
}

Result<DnsMessage> DnsMessage::parse(const std::uint8_t* data, std::size_t length) {
    if (data == nullptr || length < HEADER_SIZE) {
        return Error("Truncated DNS header", 0, "DnsMessage");
    }

    DnsMessage message;
    message.id = read16(data);
    message.flags = read16(data + 2);
    const std::uint16_t questionCount = read16(data + 4);
    const std::uint16_t answerCount = read16(data + 6);
    const std::uint16_t authorityCount = read16(data + 8);
    const std::uint16_t additionalCount = read16(data + 10);

    std::size_t offset = HEADER_SIZE;
    for (std::uint16_t i = 0; i < questionCount; ++i) {
        auto name = readName(data, length, offset);
        if (!name || offset + 4 > length) {
            return Error("Malformed question " + std::to_string(i), 0, "DnsMessage");
        }
        DnsQuestion question;
        question.name = *name;
        question.type = read16(data + offset);
        question.unicastResponse = (read16(data + offset + 2) & CLASS_UNICAST_RESPONSE) != 0;
        message.questions.push_back(std::move(question));
        offset += 4;
    }

    if (!readSection(data, length, offset, answerCount, message.answers)) {
        return Error("Malformed answer section", 0, "DnsMessage");
    }
    if (!readSection(data, length, offset, authorityCount, message.authorities)) {
        return Error("Malformed authority section", 0, "DnsMessage");
    }
    if (!readSection(data, length, offset, additionalCount, message.additionals)) {
        return Error("Malformed additional section", 0, "DnsMessage");
    }

    return message;
}

Result<std::vector<std::uint8_t>> encodeQuery(const std::vector<DnsQuestion>& questions) {
    std::vector<std::uint8_t> out;
    out.reserve(HEADER_SIZE + questions.size() * 64);
    write16(out, 0);   // id
    write16(out, 0);   // flags: standard query
    write16(out, static_cast<std::uint16_t>(questions.size()));
    write16(out, 0);
    write16(out, 0);
    write16(out, 0);

    for (const auto& question : questions) {
        if (!appendName(out, question.name)) {
            return Error("Cannot encode name '" + question.name + "'", 0, "DnsMessage");
        }
        write16(out, question.type);
        write16(out, static_cast<std::uint16_t>(CLASS_IN | (question.unicastResponse ? CLASS_UNICAST_RESPONSE : 0)));
    }
    return out;
}

Result<std::vector<std::uint8_t>> encodeQuery(const std::string& name, std::uint16_t type, bool unicastResponse) {
    return encodeQuery(std::vector<DnsQuestion>{DnsQuestion{name, type, unicastResponse}});
}

std::optional<std::vector<std::string>> splitLabels(const std::string& name) {
    std::vector<std::string> labels;
    std::string current;
    const std::size_t n = name.size();

    for (std::size_t i = 0; i < n; ++i) {
        const char c = name[i];
        if (c == '\\') {
            if (i + 1 >= n) {
                return std::nullopt;
            }
            const char next = name[i + 1];
            if (std::isdigit(static_cast<unsigned char>(next))) {
                if (i + 3 >= n ||
                    !std::isdigit(static_cast<unsigned char>(name[i + 2])) ||
                    !std::isdigit(static_cast<unsigned char>(name[i + 3]))) {
                    return std::nullopt;
                }
                const int value = (next - '0') * 100 + (name[i + 2] - '0') * 10 + (name[i + 3] - '0');
                if (value > 255) {
                    return std::nullopt;
                }
                current += static_cast<char>(value);
                i += 3;
            } else {
                current += next;
                i += 1;
            }
        } else if (c == '.') {
            if (current.empty()) {
                // A lone "." is the root; any other empty label is malformed
                if (n == 1) {
                    return labels;
                }
                return std::nullopt;
            }
            labels.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }

    if (!current.empty()) {
        labels.push_back(current);
    }
    return labels;
}

std::string escapeLabel(const std::string& label) {
    std::string out;
    out.reserve(label.size());
    for (char c : label) {
        const auto byte = static_cast<unsigned char>(c);
        if (c == '.' || c == '\\') {
            out += '\\';
            out += c;
        } else if (byte < 0x20 || byte == 0x7F) {
            char buf[5];
            std::snprintf(buf, sizeof(buf), "\\%03u", static_cast<unsigned>(byte));
            out += buf;
        } else {
            out += c;
        }
    }
    return out;
}

std::string canonicalName(const std::string& name) {
    std::size_t end = name.size();
    while (end > 0 && name[end - 1] == '.') {
        std::size_t backslashes = 0;
        while (backslashes + 1 < end && name[end - 2 - backslashes] == '\\') {
            ++backslashes;
        }
        if (backslashes % 2 == 1) {
            break;
        }
        --end;
    }

    std::string out;
    out.reserve(end);
    for (std::size_t i = 0; i < end; ++i) {
        const auto byte = static_cast<unsigned char>(name[i]);
        out += (byte < 0x80) ? static_cast<char>(std::tolower(byte)) : name[i];
    }
    return out;
}

std::optional<InstanceName> splitInstanceName(const std::string& fqdn) {
    auto labels = splitLabels(fqdn);
    if (!labels || labels->size() < 3) {
        return std::nullopt;
    }

    const auto& parts = *labels;
    for (std::size_t i = 1; i + 1 < parts.size(); ++i) {
        if (parts[i].empty() || parts[i][0] != '_') {
            continue;
        }
        const std::string proto = canonicalName(parts[i + 1]);
        if (proto != "_tcp" && proto != "_udp") {
            continue;
        }
        if (i + 2 >= parts.size()) {
            return std::nullopt;
        }

        InstanceName result;
        for (std::size_t k = 0; k < i; ++k) {
            if (k > 0) {
                result.label += '.';
            }
            result.label += parts[k];
        }
        result.type = escapeLabel(parts[i]) + "." + escapeLabel(parts[i + 1]) + ".";
        for (std::size_t k = i + 2; k < parts.size(); ++k) {
            result.domain += escapeLabel(parts[k]) + ".";
        }
        return result;
    }
    return std::nullopt;
}

std::string joinInstanceName(const std::string& label, const std::string& type, const std::string& domain) {
    return escapeLabel(label) + "." + withTrailingDot(type) + withTrailingDot(domain);
}

} // namespace LanScout::Mdns
