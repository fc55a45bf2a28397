#include "net/dns_message.hpp"

#include <stdexcept>

#include "net/cidr.hpp"

namespace netmon_agent::net::dns {
namespace {

constexpr std::size_t kHeaderSize = 12;
constexpr int kMaxPointerJumps = 32;

void put_u16(std::vector<std::uint8_t>& out, const std::uint16_t value) {
  out.push_back(static_cast<std::uint8_t>(value >> 8U));
  out.push_back(static_cast<std::uint8_t>(value & 0xFFU));
}

void put_name(std::vector<std::uint8_t>& out, const std::string& name) {
  std::size_t position = 0;
  while (position < name.size()) {
    std::size_t dot = name.find('.', position);
    if (dot == std::string::npos) {
      dot = name.size();
    }
    const std::size_t length = dot - position;
    if (length == 0 || length > 63) {
      throw std::runtime_error("invalid DNS label in " + name);
    }
    out.push_back(static_cast<std::uint8_t>(length));
    out.insert(out.end(), name.begin() + static_cast<std::ptrdiff_t>(position),
               name.begin() + static_cast<std::ptrdiff_t>(dot));
    position = dot + 1;
  }
  out.push_back(0);
}

class Reader {
 public:
  Reader(const std::uint8_t* data, std::size_t size) : data_(data), size_(size) {}

  std::uint8_t u8() {
    require(1);
    return data_[offset_++];
  }

  std::uint16_t u16() {
    require(2);
    const auto value = static_cast<std::uint16_t>((data_[offset_] << 8U) | data_[offset_ + 1]);
    offset_ += 2;
    return value;
  }

  std::uint32_t u32() {
    const std::uint32_t high = u16();
    const std::uint32_t low = u16();
    return (high << 16U) | low;
  }

  std::string name() { return read_name_at(offset_, true); }

  void skip(std::size_t count) {
    require(count);
    offset_ += count;
  }

  [[nodiscard]] std::size_t offset() const noexcept { return offset_; }

 private:
  void require(std::size_t count) const {
    if (offset_ + count > size_) {
      throw std::runtime_error("truncated DNS message");
    }
  }

  std::string read_name_at(std::size_t& cursor, bool advance_cursor) {
    std::string result;
    std::size_t position = cursor;
    bool jumped = false;
    int jumps = 0;

    while (true) {
      if (position >= size_) {
        throw std::runtime_error("truncated DNS name");
      }
      const std::uint8_t length = data_[position];
      if ((length & 0xC0U) == 0xC0U) {
        if (position + 1 >= size_) {
          throw std::runtime_error("truncated DNS pointer");
        }
        const std::size_t target = static_cast<std::size_t>(((length & 0x3FU) << 8U) | data_[position + 1]);
        if (!jumped && advance_cursor) {
          cursor = position + 2;
        }
        jumped = true;
        if (++jumps > kMaxPointerJumps) {
          throw std::runtime_error("DNS name pointer loop");
        }
        position = target;
        continue;
      }
      if (length == 0) {
        if (!jumped && advance_cursor) {
          cursor = position + 1;
        }
        break;
      }
      if (position + 1 + length > size_) {
        throw std::runtime_error("truncated DNS label");
      }
      if (!result.empty()) {
        result.push_back('.');
      }
      result.append(reinterpret_cast<const char*>(data_ + position + 1), length);
      position += 1 + length;
    }
    return result;
  }

  const std::uint8_t* data_;
  std::size_t size_;
  std::size_t offset_{0};
};

}  // namespace

std::vector<std::uint8_t> encode_query(const std::uint16_t id, const std::vector<Question>& questions,
                                       const bool recursion_desired) {
  std::vector<std::uint8_t> out;
  out.reserve(kHeaderSize + questions.size() * 32);
  put_u16(out, id);
  put_u16(out, recursion_desired ? 0x0100 : 0x0000);
  put_u16(out, static_cast<std::uint16_t>(questions.size()));
  put_u16(out, 0);
  put_u16(out, 0);
  put_u16(out, 0);

  for (const auto& question : questions) {
    put_name(out, question.name);
    put_u16(out, question.type);
    put_u16(out, question.unicast_response ? 0x8001 : 0x0001);
  }
  return out;
}

Message decode_message(const std::uint8_t* data, const std::size_t size) {
  if (size < kHeaderSize) {
    throw std::runtime_error("DNS message shorter than header");
  }

  Reader reader(data, size);
  Message message{};
  message.id = reader.u16();
  message.flags = reader.u16();
  message.rcode = message.flags & 0x000FU;
  const std::uint16_t question_count = reader.u16();
  const std::uint16_t answer_count = reader.u16();
  const std::uint16_t authority_count = reader.u16();
  const std::uint16_t additional_count = reader.u16();

  for (std::uint16_t i = 0; i < question_count; ++i) {
    Question question{};
    question.name = reader.name();
    question.type = reader.u16();
    question.unicast_response = (reader.u16() & 0x8000U) != 0;
    message.questions.push_back(std::move(question));
  }

  const std::size_t record_count = std::size_t{answer_count} + authority_count + additional_count;
  for (std::size_t i = 0; i < record_count; ++i) {
    ResourceRecord record{};
    record.name = reader.name();
    record.type = reader.u16();
    reader.u16();
    record.ttl = reader.u32();
    const std::uint16_t rdlength = reader.u16();
    const std::size_t rdata_start = reader.offset();

    switch (record.type) {
      case kTypeA:
        if (rdlength == 4) {
          const std::uint32_t address = reader.u32();
          record.data = format_ipv4(address);
        } else {
          reader.skip(rdlength);
        }
        break;
      case kTypePtr:
        record.data = reader.name();
        break;
      case kTypeSrv:
        reader.u16();
        reader.u16();
        record.port = reader.u16();
        record.data = reader.name();
        break;
      default:
        reader.skip(rdlength);
        break;
    }

    const std::size_t consumed = reader.offset() - rdata_start;
    if (consumed > rdlength) {
      throw std::runtime_error("DNS record data overruns rdlength");
    }
    reader.skip(rdlength - consumed);
    message.records.push_back(std::move(record));
  }

  return message;
}

}  // namespace netmon_agent::net::dns
