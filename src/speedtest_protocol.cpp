#include "speedtest_protocol.h"

#include <arpa/inet.h>

#include <cctype>
#include <cstring>
#include <limits>
#include <type_traits>
#include <utility>

uint64_t speedtest_hton64(uint64_t v) {
    uint32_t hi = htonl(static_cast<uint32_t>(v >> 32));
    uint32_t lo = htonl(static_cast<uint32_t>(v & 0xFFFFFFFFu));
    uint64_t out = 0;
    std::memcpy(&out, &hi, sizeof(hi));
    std::memcpy(reinterpret_cast<uint8_t*>(&out) + sizeof(hi), &lo, sizeof(lo));
    return out;
}

uint64_t speedtest_ntoh64(uint64_t v) {
    uint32_t hi = 0;
    uint32_t lo = 0;
    std::memcpy(&hi, &v, sizeof(hi));
    std::memcpy(&lo, reinterpret_cast<const uint8_t*>(&v) + sizeof(hi), sizeof(lo));
    return (static_cast<uint64_t>(ntohl(hi)) << 32) | ntohl(lo);
}

uint64_t total_segments_for(uint64_t size, size_t chunk) {
    return size / chunk + (size % chunk != 0 ? 1 : 0);
}

size_t segment_length(uint64_t size, uint64_t index, size_t chunk) {
    uint64_t offset = index * chunk;
    if (offset >= size) return 0;
    uint64_t rest = size - offset;
    return rest < chunk ? static_cast<size_t>(rest) : chunk;
}

std::string format_size_request(uint64_t size) {
    return std::to_string(size) + "\n";
}

std::optional<uint64_t> parse_size_request(const std::string& line) {
    size_t b = 0, e = line.size();
    while (b < e && std::isspace((unsigned char)line[b])) ++b;
    while (e > b && std::isspace((unsigned char)line[e - 1])) --e;
    if (b == e) return std::nullopt;

    uint64_t v = 0;
    for (size_t i = b; i < e; ++i) {
        unsigned char c = (unsigned char)line[i];
        if (!std::isdigit(c)) return std::nullopt;
        uint64_t d = c - '0';
        if (v > (std::numeric_limits<uint64_t>::max() - d) / 10) return std::nullopt;
        v = v * 10 + d;
    }
    return v;
}

std::optional<uint16_t> parse_port(const std::string& text) {
    auto v = parse_size_request(text);
    if (!v || *v == 0 || *v > 65535) return std::nullopt;
    return static_cast<uint16_t>(*v);
}

namespace {

template <typename Body>
void append_body(std::vector<uint8_t>& out, const Body& b) {
    size_t at = out.size();
    out.resize(at + sizeof(Body));
    std::memcpy(out.data() + at, &b, sizeof(Body));
}

std::vector<uint8_t> start_frame(uint8_t type, size_t reserve) {
    std::vector<uint8_t> out;
    out.reserve(sizeof(FrameHeader) + reserve);
    FrameHeader h{};
    h.magic = htonl(kMagic);
    h.type = type;
    append_body(out, h);
    return out;
}

} // namespace

std::vector<uint8_t> encode_frame(const Frame& f) {
    return std::visit([](const auto& m) -> std::vector<uint8_t> {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, OfferMsg>) {
            auto out = start_frame(MSG_OFFER, sizeof(OfferBody));
            OfferBody b{};
            b.udp_port = htons(m.udp_port);
            b.tcp_port = htons(m.tcp_port);
            append_body(out, b);
            return out;
        } else if constexpr (std::is_same_v<T, RequestMsg>) {
            auto out = start_frame(MSG_REQUEST, sizeof(RequestBody));
            RequestBody b{};
            b.requested_size = speedtest_hton64(m.requested_size);
            append_body(out, b);
            return out;
        } else if constexpr (std::is_same_v<T, PayloadMsg>) {
            auto out = start_frame(MSG_PAYLOAD, sizeof(PayloadBody) + m.data.size());
            PayloadBody b{};
            b.total_segments = speedtest_hton64(m.total_segments);
            b.segment_index = speedtest_hton64(m.segment_index);
            append_body(out, b);
            out.insert(out.end(), m.data.begin(), m.data.end());
            return out;
        } else {
            return start_frame(MSG_ACK, 0);
        }
    }, f);
}

std::optional<Frame> decode_frame(const uint8_t* data, size_t len) {
    if (data == nullptr || len < sizeof(FrameHeader)) return std::nullopt;

    FrameHeader h{};
    std::memcpy(&h, data, sizeof(h));
    if (ntohl(h.magic) != kMagic) return std::nullopt;

    const uint8_t* body = data + sizeof(FrameHeader);
    size_t body_len = len - sizeof(FrameHeader);

    switch (h.type) {
    case MSG_OFFER: {
        if (body_len < sizeof(OfferBody)) return std::nullopt;
        OfferBody b{};
        std::memcpy(&b, body, sizeof(b));
        OfferMsg m;
        m.udp_port = ntohs(b.udp_port);
        m.tcp_port = ntohs(b.tcp_port);
        return Frame{m};
    }
    case MSG_REQUEST: {
        if (body_len < sizeof(RequestBody)) return std::nullopt;
        RequestBody b{};
        std::memcpy(&b, body, sizeof(b));
        RequestMsg m;
        m.requested_size = speedtest_ntoh64(b.requested_size);
        return Frame{m};
    }
    case MSG_PAYLOAD: {
        if (body_len < sizeof(PayloadBody)) return std::nullopt;
        if (body_len - sizeof(PayloadBody) > kMaxChunkSize) return std::nullopt;
        PayloadBody b{};
        std::memcpy(&b, body, sizeof(b));
        PayloadMsg m;
        m.total_segments = speedtest_ntoh64(b.total_segments);
        m.segment_index = speedtest_ntoh64(b.segment_index);
        m.data.assign(body + sizeof(PayloadBody), data + len);
        return Frame{std::move(m)};
    }
    case MSG_ACK:
        return Frame{AckMsg{}};
    default:
        return std::nullopt;
    }
}
