// -----------------------------------------------------------------------------
// frame.cpp - wlanpipe frame codec
//
// Wire layout and API contract: see include/wlanpipe/frame.hpp
// Usage: see tests/test_frame.cpp
// -----------------------------------------------------------------------------
#include "wlanpipe/frame.hpp"

#include <cstring>        // std::memcpy
#include <iomanip>        // std::hex, std::setw, std::setfill for describe()
#include <sstream>        // std::ostringstream

namespace wlanpipe {

// ============================================================================
// Byte-order helpers
// ============================================================================
// Network byte order is written by hand so the codec never depends on the
// host's endianness or on <arpa/inet.h>.

static inline void put_u32_be(uint8_t* p, uint32_t v) {
  p[0] = static_cast<uint8_t>(v >> 24);
  p[1] = static_cast<uint8_t>(v >> 16);
  p[2] = static_cast<uint8_t>(v >> 8);
  p[3] = static_cast<uint8_t>(v);
}

static inline uint32_t get_u32_be(const uint8_t* p) {
  return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) |
         (uint32_t(p[2]) << 8)  |  uint32_t(p[3]);
}

static inline void put_u16_be(uint8_t* p, uint16_t v) {
  p[0] = static_cast<uint8_t>(v >> 8);
  p[1] = static_cast<uint8_t>(v);
}

static inline uint16_t get_u16_be(const uint8_t* p) {
  return static_cast<uint16_t>((uint16_t(p[0]) << 8) | uint16_t(p[1]));
}

// Payload index for an absolute frame offset.
static constexpr std::size_t pl(std::size_t abs_off) { return abs_off - kHeaderSize; }

// ---------- Frame accessors ----------

uint32_t Frame::status_value() const {
  return get_u32_be(&payload[0]);
}

uint16_t Frame::sync_code() const {
  return get_u16_be(&payload[0]);
}

// connect_target()
// PRE:    control_code == CONNECT (not checked here).
// POLICY: ssid_len must be 1..32 and secret_len 0..64; anything else is a bad
//         request, not something to clamp.
// OUT:    @p out fully overwritten on success, untouched on failure.
bool Frame::connect_target(wifi::TargetNetwork& out) const {
  const uint8_t ssid_len   = payload[pl(kConnSsidLenOff)];
  const uint8_t flags      = payload[pl(kConnFlagsOff)];
  const uint8_t secret_len = payload[pl(kConnSecretLenOff)];

  if (ssid_len == 0 || ssid_len > wifi::kSsidMax) return false;
  if (secret_len > wifi::kSecretMax)              return false;

  wifi::TargetNetwork t;
  t.ssid.assign(reinterpret_cast<const char*>(&payload[pl(kConnSsidOff)]), ssid_len);
  t.has_bssid = (flags & kConnFlagBssid) != 0;
  if (t.has_bssid) {
    std::memcpy(t.bssid.data(), &payload[pl(kConnBssidOff)], t.bssid.size());
  }
  const uint8_t* sec = &payload[pl(kConnSecretOff)];
  t.secret.assign(sec, sec + secret_len);

  out = t;
  return true;
}

// ---------- codec ----------

DecodeStatus decode(const uint8_t* data, std::size_t len, Frame& out) {
  if (data == nullptr || len != kFrameSize) return DecodeStatus::MalformedFrame;
  out.control_code = data[0];
  // [1..3] reserved: ignored on input, zero on output
  std::memcpy(out.payload.data(), data + kHeaderSize, kPayloadSize);
  return DecodeStatus::Ok;
}

std::vector<uint8_t> encode(const Frame& f) {
  std::vector<uint8_t> b(kFrameSize, 0);
  b[0] = f.control_code;
  std::memcpy(b.data() + kHeaderSize, f.payload.data(), kPayloadSize);
  return b;
}

// ---------- builders ----------

Frame make_status(StatusCode code) {
  Frame f;
  f.control_code = STATUS;
  put_u32_be(&f.payload[0], static_cast<uint32_t>(code));
  return f;
}

Frame make_bind_ack() {
  Frame f;
  f.control_code = BIND_ACK;
  return f;
}

Frame make_sync(uint16_t code) {
  Frame f;
  f.control_code = SYNC;
  put_u16_be(&f.payload[0], code);
  return f;
}

// make_connect()
// NOTE: lengths beyond the field capacity cannot occur; the ETL containers in
//       TargetNetwork are already bounded to 32 and 64.
Frame make_connect(const wifi::TargetNetwork& target) {
  Frame f;
  f.control_code = CONNECT;
  f.payload[pl(kConnSsidLenOff)]   = static_cast<uint8_t>(target.ssid.size());
  f.payload[pl(kConnFlagsOff)]     = target.has_bssid ? kConnFlagBssid : 0;
  f.payload[pl(kConnSecretLenOff)] = static_cast<uint8_t>(target.secret.size());

  std::memcpy(&f.payload[pl(kConnSsidOff)], target.ssid.data(), target.ssid.size());
  if (target.has_bssid) {
    std::memcpy(&f.payload[pl(kConnBssidOff)], target.bssid.data(), target.bssid.size());
  }
  if (!target.secret.empty()) {
    std::memcpy(&f.payload[pl(kConnSecretOff)], target.secret.data(), target.secret.size());
  }
  return f;
}

Frame make_unbind() {
  Frame f;
  f.control_code = UNBIND;
  return f;
}

Frame make_quit() {
  Frame f;
  f.control_code = QUIT;
  return f;
}

// ---------- naming ----------

const char* control_name(uint8_t code) {
  switch (code) {
    case SYNC:     return "SYNC";
    case CONNECT:  return "CONNECT";
    case BIND_ACK: return "BIND_ACK";
    case STATUS:   return "STATUS";
    case UNBIND:   return "UNBIND";
    case QUIT:     return "QUIT";
    default:       return "UNKNOWN";
  }
}

const char* status_name(uint32_t value) {
  switch (static_cast<StatusCode>(value)) {
    case StatusCode::Success:            return "success";
    case StatusCode::ErrGeneric:         return "err_generic";
    case StatusCode::ErrNotFound:        return "err_not_found";
    case StatusCode::ErrAssociation:     return "err_association";
    case StatusCode::ErrNoLink:          return "err_no_link";
    case StatusCode::ErrNoAddress:       return "err_no_address";
    case StatusCode::ErrInvalidArgument: return "err_invalid_argument";
  }
  return "unknown";
}

// describe()
// Lossy one-liner for logs and wlanpipe-ctl. The CONNECT secret is never
// printed, only its length.
std::string describe(const Frame& f) {
  std::ostringstream os;
  os << "code=" << control_name(f.control_code);

  switch (f.control_code) {
    case STATUS:
      os << " status=" << status_name(f.status_value());
      break;
    case SYNC:
      os << " pair_code=" << f.sync_code();
      break;
    case CONNECT: {
      wifi::TargetNetwork t;
      if (!f.connect_target(t)) {
        os << " payload=invalid";
        break;
      }
      os << " ssid=" << t.ssid.c_str();
      if (t.has_bssid) {
        os << " bssid=";
        for (std::size_t i = 0; i < t.bssid.size(); ++i) {
          if (i) os << ':';
          os << std::hex << std::setw(2) << std::setfill('0') << int(t.bssid[i]) << std::dec;
        }
      }
      os << " secret_len=" << t.secret.size();
      break;
    }
    case BIND_ACK:
    case UNBIND:
    case QUIT:
      break;
    default:
      os << " raw=0x" << std::hex << std::setw(2) << std::setfill('0')
         << int(f.control_code) << std::dec;
      break;
  }
  return os.str();
}

} // namespace wlanpipe
