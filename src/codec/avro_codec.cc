#include "avro_codec.h"

#include <cstring>
#include <limits>

#include "../common/errors.h"

namespace SalKafka {

namespace {

// ============================================================================
// Encoder
// ============================================================================

class Encoder {
public:
    explicit Encoder(std::string& out) : out_(out) {}

    void WriteLong(int64_t value) {
        uint64_t n = (static_cast<uint64_t>(value) << 1) ^ static_cast<uint64_t>(value >> 63);
        while (n & ~0x7FULL) {
            out_.push_back(static_cast<char>((n & 0x7F) | 0x80));
            n >>= 7;
        }
        out_.push_back(static_cast<char>(n));
    }

    void WriteBool(bool value) { out_.push_back(value ? 1 : 0); }

    void WriteFloat(float value) {
        uint32_t bits;
        std::memcpy(&bits, &value, sizeof(bits));
        for (int i = 0; i < 4; ++i) {
            out_.push_back(static_cast<char>((bits >> (8 * i)) & 0xFF));
        }
    }

    void WriteDouble(double value) {
        uint64_t bits;
        std::memcpy(&bits, &value, sizeof(bits));
        for (int i = 0; i < 8; ++i) {
            out_.push_back(static_cast<char>((bits >> (8 * i)) & 0xFF));
        }
    }

    void WriteString(const std::string& value) {
        WriteLong(static_cast<int64_t>(value.size()));
        out_.append(value);
    }

private:
    std::string& out_;
};

void CheckIntRange(int64_t value, const AvroField& field) {
    if (field.type == FieldType::kInt &&
        (value < std::numeric_limits<int32_t>::min() || value > std::numeric_limits<int32_t>::max())) {
        throw CodecError("field " + field.name + ": value " + std::to_string(value) +
                " out of range for Avro int");
    }
}

[[noreturn]] void ThrowTypeMismatch(const AvroField& field, const FieldValue& value) {
    throw CodecError("field " + field.name + ": cannot encode " + ToString(value) + " as " +
            (field.is_array ? "array of " : "") + FieldTypeName(field.type));
}

void EncodeScalar(Encoder& enc, const AvroField& field, const FieldValue& value) {
    switch (field.type) {
        case FieldType::kBoolean:
            if (auto* b = std::get_if<bool>(&value)) { enc.WriteBool(*b); return; }
            break;
        case FieldType::kInt:
        case FieldType::kLong:
            if (auto* i = std::get_if<int64_t>(&value)) {
                CheckIntRange(*i, field);
                enc.WriteLong(*i);
                return;
            }
            break;
        case FieldType::kFloat:
        case FieldType::kDouble: {
            double d;
            if (auto* p = std::get_if<double>(&value)) {
                d = *p;
            } else if (auto* i = std::get_if<int64_t>(&value)) {
                d = static_cast<double>(*i);
            } else {
                break;
            }
            if (field.type == FieldType::kFloat) {
                enc.WriteFloat(static_cast<float>(d));
            } else {
                enc.WriteDouble(d);
            }
            return;
        }
        case FieldType::kString:
            if (auto* s = std::get_if<std::string>(&value)) { enc.WriteString(*s); return; }
            break;
        case FieldType::kMap:
            break;
    }
    ThrowTypeMismatch(field, value);
}

template <typename T, typename Fn>
void EncodeBlock(Encoder& enc, const std::vector<T>& items, Fn&& write_item) {
    if (!items.empty()) {
        enc.WriteLong(static_cast<int64_t>(items.size()));
        for (size_t i = 0; i < items.size(); ++i) {
            write_item(static_cast<T>(items[i]));
        }
    }
    enc.WriteLong(0);
}

void EncodeArray(Encoder& enc, const AvroField& field, const FieldValue& value) {
    switch (field.type) {
        case FieldType::kBoolean:
            if (auto* v = std::get_if<std::vector<bool>>(&value)) {
                EncodeBlock(enc, *v, [&](bool b) { enc.WriteBool(b); });
                return;
            }
            break;
        case FieldType::kInt:
        case FieldType::kLong:
            if (auto* v = std::get_if<std::vector<int64_t>>(&value)) {
                EncodeBlock(enc, *v, [&](int64_t i) {
                    CheckIntRange(i, field);
                    enc.WriteLong(i);
                });
                return;
            }
            break;
        case FieldType::kFloat:
        case FieldType::kDouble: {
            std::vector<double> items;
            if (auto* v = std::get_if<std::vector<double>>(&value)) {
                items = *v;
            } else if (auto* ints = std::get_if<std::vector<int64_t>>(&value)) {
                items.assign(ints->begin(), ints->end());
            } else {
                break;
            }
            EncodeBlock(enc, items, [&](double d) {
                if (field.type == FieldType::kFloat) {
                    enc.WriteFloat(static_cast<float>(d));
                } else {
                    enc.WriteDouble(d);
                }
            });
            return;
        }
        case FieldType::kString:
            if (auto* v = std::get_if<std::vector<std::string>>(&value)) {
                EncodeBlock(enc, *v, [&](const std::string& s) { enc.WriteString(s); });
                return;
            }
            break;
        case FieldType::kMap:
            break;
    }
    ThrowTypeMismatch(field, value);
}

// ============================================================================
// Decoder
// ============================================================================

class Decoder {
public:
    Decoder(std::string_view data, const std::string& field) : data_(data), field_(field) {}

    void SetField(const std::string& field) { field_ = field; }

    int64_t ReadLong() {
        uint64_t n = 0;
        int shift = 0;
        while (true) {
            if (shift >= 64) {
                throw CodecError("field " + field_ + ": varint too long");
            }
            const uint8_t byte = static_cast<uint8_t>(Take(1)[0]);
            n |= static_cast<uint64_t>(byte & 0x7F) << shift;
            if (!(byte & 0x80)) break;
            shift += 7;
        }
        return static_cast<int64_t>(n >> 1) ^ -static_cast<int64_t>(n & 1);
    }

    bool ReadBool() { return Take(1)[0] != 0; }

    float ReadFloat() {
        const auto* p = reinterpret_cast<const uint8_t*>(Take(4).data());
        uint32_t bits = 0;
        for (int i = 0; i < 4; ++i) bits |= static_cast<uint32_t>(p[i]) << (8 * i);
        float value;
        std::memcpy(&value, &bits, sizeof(value));
        return value;
    }

    double ReadDouble() {
        const auto* p = reinterpret_cast<const uint8_t*>(Take(8).data());
        uint64_t bits = 0;
        for (int i = 0; i < 8; ++i) bits |= static_cast<uint64_t>(p[i]) << (8 * i);
        double value;
        std::memcpy(&value, &bits, sizeof(value));
        return value;
    }

    std::string ReadString() {
        const int64_t len = ReadLong();
        if (len < 0) {
            throw CodecError("field " + field_ + ": negative string length");
        }
        std::string_view bytes = Take(static_cast<size_t>(len));
        return std::string(bytes);
    }

    // Next block count; a negative count is followed by the block byte size
    int64_t ReadBlockCount() {
        int64_t count = ReadLong();
        if (count < 0) {
            if (count == std::numeric_limits<int64_t>::min()) {
                throw CodecError("field " + field_ + ": invalid block count");
            }
            ReadLong();
            count = -count;
        }
        return count;
    }

    bool AtEnd() const { return pos_ == data_.size(); }

private:
    std::string_view Take(size_t n) {
        if (n > data_.size() - pos_) {
            throw CodecError("field " + field_ + ": truncated payload");
        }
        std::string_view out = data_.substr(pos_, n);
        pos_ += n;
        return out;
    }

    std::string_view data_;
    size_t pos_ = 0;
    std::string field_;
};

template <typename T, typename Fn>
std::vector<T> DecodeBlocks(Decoder& dec, Fn&& read_item) {
    std::vector<T> items;
    for (int64_t count = dec.ReadBlockCount(); count != 0; count = dec.ReadBlockCount()) {
        for (int64_t i = 0; i < count; ++i) {
            items.push_back(read_item());
        }
    }
    return items;
}

FieldValue DecodeField(Decoder& dec, const AvroField& field) {
    if (field.is_array) {
        switch (field.type) {
            case FieldType::kBoolean:
                return DecodeBlocks<bool>(dec, [&] { return dec.ReadBool(); });
            case FieldType::kInt:
            case FieldType::kLong:
                return DecodeBlocks<int64_t>(dec, [&] { return dec.ReadLong(); });
            case FieldType::kFloat:
                return DecodeBlocks<double>(dec, [&] { return static_cast<double>(dec.ReadFloat()); });
            case FieldType::kDouble:
                return DecodeBlocks<double>(dec, [&] { return dec.ReadDouble(); });
            case FieldType::kString:
                return DecodeBlocks<std::string>(dec, [&] { return dec.ReadString(); });
            case FieldType::kMap:
                break;
        }
    } else {
        switch (field.type) {
            case FieldType::kBoolean: return dec.ReadBool();
            case FieldType::kInt:
            case FieldType::kLong: return dec.ReadLong();
            case FieldType::kFloat: return static_cast<double>(dec.ReadFloat());
            case FieldType::kDouble: return dec.ReadDouble();
            case FieldType::kString: return dec.ReadString();
            case FieldType::kMap: break;
        }
    }
    throw CodecError("field " + field.name + ": map fields cannot be decoded");
}

} // namespace

std::string EncodeAvro(const AvroSchema& schema, const FieldMap& fields) {
    std::string out;
    Encoder enc(out);
    for (const auto& field : schema.fields()) {
        auto it = fields.find(field.name);
        if (it == fields.end()) {
            throw CodecError("field " + field.name + " missing from record " + schema.FullName());
        }
        if (field.is_array) {
            EncodeArray(enc, field, it->second);
        } else {
            EncodeScalar(enc, field, it->second);
        }
    }
    return out;
}

FieldMap DecodeAvro(const AvroSchema& schema, std::string_view body) {
    FieldMap fields;
    Decoder dec(body, schema.FullName());
    for (const auto& field : schema.fields()) {
        dec.SetField(field.name);
        fields.emplace(field.name, DecodeField(dec, field));
    }
    if (!dec.AtEnd()) {
        throw CodecError("record " + schema.FullName() + ": trailing bytes after last field");
    }
    return fields;
}

} // namespace SalKafka
