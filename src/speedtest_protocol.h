#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Every frame starts with this sentinel followed by a one-byte type tag.
constexpr uint32_t kMagic = 0xABCDDCBAu;

constexpr uint16_t kDiscoveryPort = 13117;   // well-known broadcast port
constexpr size_t kChunkSize = 1024;          // UDP payload bytes per segment
constexpr size_t kTcpChunkSize = 4096;       // TCP write size on the server
constexpr size_t kMaxDatagram = 65507;       // max IPv4 UDP payload

enum : uint8_t {
    MSG_OFFER   = 0x02,
    MSG_REQUEST = 0x03,
    MSG_PAYLOAD = 0x04,
    MSG_ACK     = 0x05,
};

#pragma pack(push, 1)
struct FrameHeader {
    uint32_t magic;  // network order
    uint8_t  type;
};

struct OfferBody {
    uint16_t udp_port; // network order
    uint16_t tcp_port; // network order
};

struct RequestBody {
    uint64_t requested_size; // network order
};

struct PayloadBody {
    uint64_t total_segments; // network order
    uint64_t segment_index;  // network order, 0-based
};
#pragma pack(pop)

static_assert(sizeof(FrameHeader) == 5, "FrameHeader must be 5 bytes");
static_assert(sizeof(OfferBody) == 4, "OfferBody must be 4 bytes");
static_assert(sizeof(RequestBody) == 8, "RequestBody must be 8 bytes");
static_assert(sizeof(PayloadBody) == 16, "PayloadBody must be 16 bytes");

constexpr size_t kPayloadHeaderSize = sizeof(FrameHeader) + sizeof(PayloadBody);
constexpr size_t kMaxChunkSize = kMaxDatagram - kPayloadHeaderSize;

struct OfferMsg {
    uint16_t udp_port = 0;
    uint16_t tcp_port = 0;
    bool operator==(const OfferMsg& o) const {
        return udp_port == o.udp_port && tcp_port == o.tcp_port;
    }
};

struct RequestMsg {
    uint64_t requested_size = 0;
    bool operator==(const RequestMsg& o) const { return requested_size == o.requested_size; }
};

struct PayloadMsg {
    uint64_t total_segments = 0;
    uint64_t segment_index = 0;
    std::vector<uint8_t> data;
    bool operator==(const PayloadMsg& o) const {
        return total_segments == o.total_segments && segment_index == o.segment_index &&
               data == o.data;
    }
};

struct AckMsg {
    bool operator==(const AckMsg&) const { return true; }
};

using Frame = std::variant<OfferMsg, RequestMsg, PayloadMsg, AckMsg>;

// A discovered server: source address of its Offer plus the advertised ports.
struct ServerEndpoint {
    std::string ip;
    uint16_t udp_port = 0;
    uint16_t tcp_port = 0;

    std::string label() const {
        return ip + " (udp " + std::to_string(udp_port) + ", tcp " + std::to_string(tcp_port) + ")";
    }
};

// Serialize a frame into its big-endian wire form.
std::vector<uint8_t> encode_frame(const Frame& f);

// Parse a datagram. Returns nullopt for a bad sentinel, an unknown type tag,
// or a buffer too short for the type's fixed fields. Never throws.
std::optional<Frame> decode_frame(const uint8_t* data, size_t len);

inline std::optional<Frame> decode_frame(const std::vector<uint8_t>& bytes) {
    return decode_frame(bytes.data(), bytes.size());
}

// TCP requests are plain text: "<decimal>\n".
std::string format_size_request(uint64_t size);

// Parse a size request line (surrounding whitespace allowed). Rejects signs,
// junk and values that overflow 64 bits.
std::optional<uint64_t> parse_size_request(const std::string& line);

// ceil(size / chunk); chunk must be non-zero.
uint64_t total_segments_for(uint64_t size, size_t chunk = kChunkSize);

// Byte length of segment `index` when `size` bytes are split into `chunk`-sized
// pieces. The final segment carries the remainder.
size_t segment_length(uint64_t size, uint64_t index, size_t chunk = kChunkSize);

// Decimal port number in 1..65535.
std::optional<uint16_t> parse_port(const std::string& text);

uint64_t speedtest_hton64(uint64_t v);
uint64_t speedtest_ntoh64(uint64_t v);
