#include "bufobj/bbo.hpp"

#include <cmath>
#include <cstring>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>

#include <zlib.h>

namespace bufobj {

BboError::BboError(ErrorKind k, const std::string& msg)
    : std::runtime_error(msg), kind_(k) {}

ErrorKind BboError::kind() const noexcept { return kind_; }

std::string to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::UnsupportedType: return "unsupported type";
        case ErrorKind::SizeUnderestimate: return "size underestimate";
        case ErrorKind::DecodeError: return "decode error";
        case ErrorKind::ChecksumMismatch: return "checksum mismatch";
        case ErrorKind::TypeMismatch: return "type mismatch";
        case ErrorKind::InvalidData: return "invalid data";
        case ErrorKind::JsonParse: return "json parse error";
    }
    return "unknown error";
}

// ------------------------------
// Small helpers
// ------------------------------

static constexpr std::size_t kNumberWidth = 8;
static constexpr std::size_t kBooleanWidth = 1;

// Conservative sizing widths.
static constexpr std::size_t kLooseBooleanWidth = 4;
static constexpr std::size_t kLooseBytesPerCodePoint = 4;
static constexpr std::size_t kLooseBytesPerKeyChar = 2;

static constexpr std::size_t kMaxJsonDepth = 512;

static bool checked_add_u64(std::uint64_t a, std::uint64_t b, std::uint64_t& out) {
    if (a > (std::numeric_limits<std::uint64_t>::max)() - b) return false;
    out = a + b;
    return true;
}

static void write_f64_le(std::uint8_t* p, double d) {
    std::uint64_t u = 0;
    std::memcpy(&u, &d, sizeof(u));
    for (int i = 0; i < 8; ++i) p[i] = static_cast<std::uint8_t>((u >> (8*i)) & 0xFFu);
}

static double read_f64_le_from(const std::uint8_t* p) {
    std::uint64_t u = 0;
    for (int i = 0; i < 8; ++i) u |= (static_cast<std::uint64_t>(p[i]) << (8*i));
    double d = 0.0;
    std::memcpy(&d, &u, sizeof(d));
    return d;
}

static std::uint64_t f64_bits(double d) {
    std::uint64_t u = 0;
    std::memcpy(&u, &d, sizeof(u));
    return u;
}

static std::string upper_hex8(std::uint32_t v) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setw(8) << std::setfill('0') << v;
    return oss.str();
}

static std::uint32_t crc32_bytes(const std::uint8_t* data, std::size_t len) {
    uLong crc = ::crc32(0L, Z_NULL, 0);
    crc = ::crc32(crc, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(len));
    return static_cast<std::uint32_t>(crc);
}

// Strict UTF-8 scan. Returns false at the first malformed sequence and
// reports its byte position in `bad_at`.
static bool utf8_scan(const std::uint8_t* p, std::size_t n, std::size_t& count, std::size_t& bad_at) {
    count = 0;
    std::size_t i = 0;
    while (i < n) {
        const std::uint8_t c = p[i];
        std::size_t extra = 0;
        std::uint32_t cp = 0;
        std::uint32_t min_cp = 0;
        if (c < 0x80) {
            ++i;
            ++count;
            continue;
        } else if ((c & 0xE0u) == 0xC0u) {
            extra = 1; cp = c & 0x1Fu; min_cp = 0x80;
        } else if ((c & 0xF0u) == 0xE0u) {
            extra = 2; cp = c & 0x0Fu; min_cp = 0x800;
        } else if ((c & 0xF8u) == 0xF0u) {
            extra = 3; cp = c & 0x07u; min_cp = 0x10000;
        } else {
            bad_at = i;
            return false;
        }
        if (extra > n - i - 1) {
            bad_at = i;
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            const std::uint8_t cc = p[i + k];
            if ((cc & 0xC0u) != 0x80u) {
                bad_at = i;
                return false;
            }
            cp = (cp << 6) | (cc & 0x3Fu);
        }
        if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            bad_at = i;
            return false;
        }
        i += extra + 1;
        ++count;
    }
    return true;
}

std::optional<std::size_t> utf8_length(std::string_view s) {
    std::size_t count = 0;
    std::size_t bad_at = 0;
    if (!utf8_scan(reinterpret_cast<const std::uint8_t*>(s.data()), s.size(), count, bad_at)) {
        return std::nullopt;
    }
    return count;
}

static std::vector<std::string> split_path(const std::string& s) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (start <= s.size()) {
        auto dot = s.find('.', start);
        if (dot == std::string::npos) dot = s.size();
        parts.push_back(s.substr(start, dot - start));
        start = dot + 1;
        if (dot == s.size()) break;
    }
    for (const auto& p : parts) {
        if (p.empty()) {
            throw BboError(ErrorKind::InvalidData, "invalid path '" + s + "': empty segment");
        }
    }
    return parts;
}

static bool parse_index(const std::string& s, std::size_t& out) {
    if (s.empty()) return false;
    std::size_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        const std::size_t d = static_cast<std::size_t>(c - '0');
        if (v > ((std::numeric_limits<std::size_t>::max)() - d) / 10) return false;
        v = v * 10 + d;
    }
    out = v;
    return true;
}

static std::string field_label(ValueType parent_kind, const FieldDescriptor& f) {
    if (parent_kind == ValueType::Array) return "[" + std::to_string(f.index) + "]";
    return f.name;
}

// ------------------------------
// ValueType helpers
// ------------------------------

std::string to_string(ValueType t) {
    switch (t) {
        case ValueType::Number: return "number";
        case ValueType::Boolean: return "boolean";
        case ValueType::String: return "string";
        case ValueType::Null: return "null";
        case ValueType::Object: return "object";
        case ValueType::Array: return "array";
    }
    return "unknown";
}

ValueType value_type_from_string(const std::string& s) {
    if (s == "number") return ValueType::Number;
    if (s == "boolean") return ValueType::Boolean;
    if (s == "string") return ValueType::String;
    if (s == "null") return ValueType::Null;
    if (s == "object") return ValueType::Object;
    if (s == "array") return ValueType::Array;
    throw BboError(ErrorKind::UnsupportedType, "unknown value type tag: '" + s + "'");
}

// ------------------------------
// Value helpers
// ------------------------------

Value Value::make_null() {
    Value v;
    v.v = nullptr;
    return v;
}

Value Value::make_boolean(bool b) {
    Value v;
    v.v = b;
    return v;
}

Value Value::make_number(double d) {
    Value v;
    v.v = d;
    return v;
}

Value Value::make_string(std::string s) {
    Value v;
    v.v = std::move(s);
    return v;
}

Value Value::make_object() {
    Value v;
    v.v = Object{};
    return v;
}

Value Value::make_object(Object members) {
    Value v;
    v.v = std::move(members);
    return v;
}

Value Value::make_array() {
    Value v;
    v.v = Array{};
    return v;
}

Value Value::make_array(Array items) {
    Value v;
    v.v = std::move(items);
    return v;
}

ValueType Value::type() const {
    switch (v.index()) {
        case 0: return ValueType::Null;
        case 1: return ValueType::Boolean;
        case 2: return ValueType::Number;
        case 3: return ValueType::String;
        case 4: return ValueType::Object;
        case 5: return ValueType::Array;
        default: break;
    }
    throw BboError(ErrorKind::UnsupportedType, "value holds no supported type");
}

bool Value::is_null() const noexcept { return std::holds_alternative<std::nullptr_t>(v); }
bool Value::is_boolean() const noexcept { return std::holds_alternative<bool>(v); }
bool Value::is_number() const noexcept { return std::holds_alternative<double>(v); }
bool Value::is_string() const noexcept { return std::holds_alternative<std::string>(v); }
bool Value::is_object() const noexcept { return std::holds_alternative<Object>(v); }
bool Value::is_array() const noexcept { return std::holds_alternative<Array>(v); }

bool Value::as_boolean() const {
    if (!is_boolean()) throw BboError(ErrorKind::TypeMismatch, "value is not a boolean");
    return std::get<bool>(v);
}

double Value::as_number() const {
    if (!is_number()) throw BboError(ErrorKind::TypeMismatch, "value is not a number");
    return std::get<double>(v);
}

const std::string& Value::as_string() const {
    if (!is_string()) throw BboError(ErrorKind::TypeMismatch, "value is not a string");
    return std::get<std::string>(v);
}

const Value::Object& Value::as_object() const {
    if (!is_object()) throw BboError(ErrorKind::TypeMismatch, "value is not an object");
    return std::get<Object>(v);
}

Value::Object& Value::as_object() {
    if (!is_object()) throw BboError(ErrorKind::TypeMismatch, "value is not an object");
    return std::get<Object>(v);
}

const Value::Array& Value::as_array() const {
    if (!is_array()) throw BboError(ErrorKind::TypeMismatch, "value is not an array");
    return std::get<Array>(v);
}

Value::Array& Value::as_array() {
    if (!is_array()) throw BboError(ErrorKind::TypeMismatch, "value is not an array");
    return std::get<Array>(v);
}

const Value* Value::get(std::string_view key) const {
    for (const auto& kv : as_object()) {
        if (kv.first == key) return &kv.second;
    }
    return nullptr;
}

Value& Value::set(std::string key, Value member) {
    auto& obj = as_object();
    for (auto& kv : obj) {
        if (kv.first == key) {
            kv.second = std::move(member);
            return kv.second;
        }
    }
    obj.emplace_back(std::move(key), std::move(member));
    return obj.back().second;
}

Value& Value::push(Value item) {
    auto& arr = as_array();
    arr.push_back(std::move(item));
    return arr.back();
}

// Numbers compare bit-exact.
bool operator==(const Value& a, const Value& b) {
    if (a.v.index() != b.v.index()) return false;
    if (a.is_number()) return f64_bits(std::get<double>(a.v)) == f64_bits(std::get<double>(b.v));
    return a.v == b.v;
}

bool operator!=(const Value& a, const Value& b) { return !(a == b); }

// ------------------------------
// Record
// ------------------------------

Record::Record(std::shared_ptr<const Buffer> buffer, ValueType kind, std::uint64_t offset)
    : buffer_(std::move(buffer)), kind_(kind), offset_(offset) {
    if (!buffer_) throw BboError(ErrorKind::InvalidData, "record requires a buffer");
    if (kind_ != ValueType::Object && kind_ != ValueType::Array) {
        throw BboError(ErrorKind::InvalidData, "record kind must be object or array, got " + to_string(kind_));
    }
    if (offset_ > buffer_->size()) {
        throw BboError(ErrorKind::InvalidData, "record offset lies outside the buffer");
    }
}

const FieldDescriptor* Record::find(std::string_view name) const {
    if (kind_ != ValueType::Object) return nullptr;
    auto it = by_name_.find(name);
    if (it == by_name_.end()) return nullptr;
    return &fields_[it->second];
}

const FieldDescriptor* Record::at(std::size_t index) const {
    if (index >= fields_.size()) return nullptr;
    return &fields_[index];
}

void Record::add_field(FieldDescriptor f) {
    f.index = fields_.size();
    const std::string label = field_label(kind_, f);

    std::uint64_t end = 0;
    if (!checked_add_u64(f.offset, f.length, end) || end > buffer_->size()) {
        throw BboError(ErrorKind::InvalidData, "field '" + label + "' exceeds buffer bounds");
    }
    const std::uint64_t floor = offset_ + length_;
    if (f.offset < floor) {
        throw BboError(ErrorKind::InvalidData, "field '" + label + "' overlaps the preceding field");
    }

    switch (f.type) {
        case ValueType::Number:
        case ValueType::Boolean:
        case ValueType::Null: {
            const std::uint64_t want = f.type == ValueType::Number ? kNumberWidth
                                     : f.type == ValueType::Boolean ? kBooleanWidth : 0;
            if (f.length != want) {
                throw BboError(ErrorKind::InvalidData,
                    "field '" + label + "' of type " + to_string(f.type) + " must span " + std::to_string(want) + " bytes");
            }
            if (f.child) throw BboError(ErrorKind::InvalidData, "leaf field '" + label + "' carries a child record");
            break;
        }
        case ValueType::String:
            if (f.child) throw BboError(ErrorKind::InvalidData, "leaf field '" + label + "' carries a child record");
            break;
        case ValueType::Object:
        case ValueType::Array:
            if (!f.child) throw BboError(ErrorKind::InvalidData, "composite field '" + label + "' has no child record");
            if (f.child->buffer() != buffer_) {
                throw BboError(ErrorKind::InvalidData, "child record of '" + label + "' uses a different buffer");
            }
            if (f.child->kind() != f.type) {
                throw BboError(ErrorKind::InvalidData, "child record of '" + label + "' does not match its type tag");
            }
            if (f.child->offset() != f.offset || f.child->length() != f.length) {
                throw BboError(ErrorKind::InvalidData, "child record of '" + label + "' does not match its byte range");
            }
            break;
    }

    if (kind_ == ValueType::Object) {
        if (!by_name_.emplace(f.name, f.index).second) {
            throw BboError(ErrorKind::InvalidData, "duplicate key '" + f.name + "'");
        }
    } else if (!f.name.empty()) {
        throw BboError(ErrorKind::InvalidData, "array element " + label + " must not carry a name");
    }

    length_ = end - offset_;
    fields_.push_back(std::move(f));
}

// ------------------------------
// Size estimation
// ------------------------------

std::size_t estimate(const Value& value, Sizing sizing) {
    const bool exact = sizing == Sizing::Exact;
    std::size_t total = 0;

    std::vector<const Value*> work;
    work.push_back(&value);
    while (!work.empty()) {
        const Value* cur = work.back();
        work.pop_back();

        switch (cur->type()) {
            case ValueType::Number:
                total += kNumberWidth;
                break;
            case ValueType::Boolean:
                total += exact ? kBooleanWidth : kLooseBooleanWidth;
                break;
            case ValueType::String: {
                const auto& s = std::get<std::string>(cur->v);
                if (exact) {
                    total += s.size();
                } else {
                    // Malformed text is rejected by the encoder; count raw bytes so the bound still holds.
                    auto cps = utf8_length(s);
                    total += kLooseBytesPerCodePoint * (cps ? *cps : s.size());
                }
                break;
            }
            case ValueType::Null:
                break;
            case ValueType::Object:
                for (const auto& kv : std::get<Value::Object>(cur->v)) {
                    if (!exact) total += kLooseBytesPerKeyChar * kv.first.size();
                    work.push_back(&kv.second);
                }
                break;
            case ValueType::Array:
                for (const auto& item : std::get<Value::Array>(cur->v)) work.push_back(&item);
                break;
        }
    }
    return total;
}

// ------------------------------
// Encoder
// ------------------------------

namespace {

class Encoder {
public:
    Encoder(std::shared_ptr<Buffer> buf, const EncodeOptions& opts)
        : buf_(std::move(buf)), shared_(buf_), opts_(opts) {}

    std::shared_ptr<const Record> run(const Value& root) {
        const ValueType root_type = root.type();
        if (root_type != ValueType::Object && root_type != ValueType::Array) {
            throw BboError(ErrorKind::UnsupportedType,
                "root value must be an object or array, got " + to_string(root_type));
        }

        std::vector<Frame> stack;
        stack.push_back(Frame{&root, std::make_shared<Record>(shared_, root_type, cursor_), 0, {}});

        while (true) {
            Frame& top = stack.back();
            const bool is_obj = top.value->is_object();
            const std::size_t count = is_obj ? std::get<Value::Object>(top.value->v).size()
                                             : std::get<Value::Array>(top.value->v).size();

            if (top.next == count) {
                Frame done = std::move(top);
                stack.pop_back();
                if (stack.empty()) return done.record;

                FieldDescriptor f;
                f.name = std::move(done.name);
                f.type = done.record->kind();
                f.offset = done.record->offset();
                f.length = done.record->length();
                f.child = std::move(done.record);
                stack.back().record->add_field(std::move(f));
                continue;
            }

            std::string name;
            const Value* member = nullptr;
            if (is_obj) {
                const auto& kv = std::get<Value::Object>(top.value->v)[top.next];
                name = kv.first;
                member = &kv.second;
            } else {
                member = &std::get<Value::Array>(top.value->v)[top.next];
            }
            ++top.next;

            const ValueType t = member->type();
            if (t == ValueType::Object || t == ValueType::Array) {
                auto child = std::make_shared<Record>(shared_, t, cursor_);
                stack.push_back(Frame{member, std::move(child), 0, std::move(name)});
                continue;
            }
            encode_leaf(*top.record, std::move(name), *member, t);
        }
    }

private:
    struct Frame {
        const Value* value;
        std::shared_ptr<Record> record;
        std::size_t next;
        std::string name; // key in the parent object
    };

    std::uint8_t* reserve(std::size_t n) {
        if (n > buf_->size() - cursor_) {
            std::ostringstream oss;
            oss << "encoder needs " << n << " bytes at offset " << cursor_
                << " but the buffer holds only " << buf_->size();
            throw BboError(ErrorKind::SizeUnderestimate, oss.str());
        }
        std::uint8_t* p = buf_->data() + cursor_;
        cursor_ += n;
        return p;
    }

    void encode_leaf(Record& rec, std::string name, const Value& v, ValueType t) {
        FieldDescriptor f;
        f.name = std::move(name);
        f.type = t;
        f.offset = cursor_;

        switch (t) {
            case ValueType::Number: {
                write_f64_le(reserve(kNumberWidth), std::get<double>(v.v));
                f.length = kNumberWidth;
                break;
            }
            case ValueType::Boolean: {
                *reserve(kBooleanWidth) = std::get<bool>(v.v) ? 1 : 0;
                f.length = kBooleanWidth;
                break;
            }
            case ValueType::String: {
                const auto& s = std::get<std::string>(v.v);
                if (!utf8_length(s)) {
                    f.index = rec.size();
                    throw BboError(ErrorKind::InvalidData,
                        "string field '" + field_label(rec.kind(), f) + "' is not valid UTF-8");
                }
                std::uint8_t* p = reserve(s.size());
                if (!s.empty()) std::memcpy(p, s.data(), s.size());
                f.length = s.size();
                break;
            }
            case ValueType::Null:
                f.length = 0;
                break;
            default:
                throw BboError(ErrorKind::UnsupportedType, "unsupported leaf type " + to_string(t));
        }

        if (opts_.include_crc32 && f.length != 0) {
            f.crc32 = crc32_bytes(buf_->data() + f.offset, static_cast<std::size_t>(f.length));
            f.has_crc32 = true;
        }
        rec.add_field(std::move(f));
    }

    std::shared_ptr<Buffer> buf_;
    std::shared_ptr<const Buffer> shared_;
    EncodeOptions opts_;
    std::size_t cursor_{0};
};

} // namespace

std::shared_ptr<const Record> encode_record(const Value& value, const EncodeOptions& opts) {
    auto buf = std::make_shared<Buffer>(estimate(value, opts.sizing));
    Encoder enc(std::move(buf), opts);
    return enc.run(value);
}

View encode(const Value& value, const EncodeOptions& opts, const ReadOptions& read_opts) {
    return View(encode_record(value, opts), read_opts);
}

// ------------------------------
// Lazy view
// ------------------------------

View::View(std::shared_ptr<const Record> record, ReadOptions opts)
    : record_(std::move(record)), opts_(std::move(opts)) {
    if (!record_) throw BboError(ErrorKind::InvalidData, "view requires a record");
}

const Record& View::record() const {
    if (!record_) throw BboError(ErrorKind::InvalidData, "empty view");
    return *record_;
}

ValueType View::kind() const { return record().kind(); }
bool View::is_object() const { return kind() == ValueType::Object; }
bool View::is_array() const { return kind() == ValueType::Array; }
std::size_t View::size() const { return record().size(); }

std::optional<Decoded> View::get(std::string_view key) const {
    const Record& r = record();
    if (r.kind() != ValueType::Object) {
        throw BboError(ErrorKind::TypeMismatch, "field name '" + std::string(key) + "' used on an array view");
    }
    const FieldDescriptor* f = r.find(key);
    if (!f) return std::nullopt;
    return decode(*f);
}

std::optional<Decoded> View::get(std::size_t index) const {
    const Record& r = record();
    if (r.kind() != ValueType::Array) {
        throw BboError(ErrorKind::TypeMismatch, "index " + std::to_string(index) + " used on an object view");
    }
    const FieldDescriptor* f = r.at(index);
    if (!f) return std::nullopt;
    return decode(*f);
}

std::optional<Decoded> View::find(const std::string& path) const {
    const auto parts = split_path(path);
    View cur = *this;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        std::optional<Decoded> d;
        if (cur.is_array()) {
            std::size_t idx = 0;
            if (!parse_index(parts[i], idx)) return std::nullopt;
            d = cur.get(idx);
        } else {
            d = cur.get(parts[i]);
        }
        if (!d) return std::nullopt;
        if (i + 1 == parts.size()) return d;
        if (!d->is_view()) return std::nullopt;
        cur = d->as_view();
    }
    return std::nullopt;
}

std::vector<std::string> View::keys() const {
    const Record& r = record();
    if (r.kind() != ValueType::Object) throw BboError(ErrorKind::TypeMismatch, "keys() on an array view");
    std::vector<std::string> out;
    out.reserve(r.size());
    for (const auto& f : r.fields()) out.push_back(f.name);
    return out;
}

Decoded View::decode(const FieldDescriptor& f) const {
    Decoded out;
    switch (f.type) {
        case ValueType::Null:
            out.v = nullptr;
            return out;
        case ValueType::Object:
        case ValueType::Array:
            out.v = View(f.child, opts_);
            return out;
        default:
            break;
    }

    auto label = [&] { return field_label(record_->kind(), f); };
    const Buffer& buf = *record_->buffer();
    std::uint64_t end = 0;
    if (!checked_add_u64(f.offset, f.length, end) || end > buf.size()) {
        throw BboError(ErrorKind::DecodeError, "field '" + label() + "' exceeds buffer bounds");
    }
    const std::uint8_t* p = buf.data() + f.offset;
    const std::size_t len = static_cast<std::size_t>(f.length);

    if (opts_.on_read) opts_.on_read(f.offset, f.length);

    if (opts_.validate && f.has_crc32) {
        std::uint32_t got = crc32_bytes(p, len);
        if (got != f.crc32) {
            std::ostringstream oss;
            oss << "field CRC mismatch for '" << label() << "': expected " << upper_hex8(f.crc32) << ", got " << upper_hex8(got);
            throw BboError(ErrorKind::ChecksumMismatch, oss.str());
        }
    }

    switch (f.type) {
        case ValueType::Number:
            if (len != kNumberWidth) throw BboError(ErrorKind::DecodeError, "number field '" + label() + "' is not 8 bytes");
            out.v = read_f64_le_from(p);
            return out;
        case ValueType::Boolean:
            if (len != kBooleanWidth) throw BboError(ErrorKind::DecodeError, "boolean field '" + label() + "' is not 1 byte");
            out.v = (p[0] == 1);
            return out;
        case ValueType::String: {
            std::size_t count = 0;
            std::size_t bad_at = 0;
            if (!utf8_scan(p, len, count, bad_at)) {
                throw BboError(ErrorKind::DecodeError,
                    "invalid UTF-8 in string field '" + label() + "' at byte " + std::to_string(bad_at));
            }
            out.v = std::string(reinterpret_cast<const char*>(p), len);
            return out;
        }
        default:
            break;
    }
    throw BboError(ErrorKind::DecodeError, "field '" + label() + "' has an unknown type tag");
}

static Value to_value(const Decoded& d) {
    switch (d.v.index()) {
        case 0: return Value::make_null();
        case 1: return Value::make_boolean(std::get<bool>(d.v));
        case 2: return Value::make_number(std::get<double>(d.v));
        case 3: return Value::make_string(std::get<std::string>(d.v));
        default: break;
    }
    return std::get<View>(d.v).materialize();
}

Value View::materialize() const {
    const Record& r = record();
    const bool is_obj = r.kind() == ValueType::Object;
    Value out = is_obj ? Value::make_object() : Value::make_array();
    for (const auto& f : r.fields()) {
        Value member = to_value(decode(f));
        if (is_obj) {
            out.as_object().emplace_back(f.name, std::move(member));
        } else {
            out.as_array().push_back(std::move(member));
        }
    }
    return out;
}

ValueType Decoded::type() const {
    switch (v.index()) {
        case 0: return ValueType::Null;
        case 1: return ValueType::Boolean;
        case 2: return ValueType::Number;
        case 3: return ValueType::String;
        default: break;
    }
    return std::get<View>(v).kind();
}

bool Decoded::as_boolean() const {
    if (!is_boolean()) throw BboError(ErrorKind::TypeMismatch, "decoded " + to_string(type()) + " is not a boolean");
    return std::get<bool>(v);
}

double Decoded::as_number() const {
    if (!is_number()) throw BboError(ErrorKind::TypeMismatch, "decoded " + to_string(type()) + " is not a number");
    return std::get<double>(v);
}

const std::string& Decoded::as_string() const {
    if (!is_string()) throw BboError(ErrorKind::TypeMismatch, "decoded " + to_string(type()) + " is not a string");
    return std::get<std::string>(v);
}

const View& Decoded::as_view() const {
    if (!is_view()) throw BboError(ErrorKind::TypeMismatch, "decoded " + to_string(type()) + " is not an object or array");
    return std::get<View>(v);
}

std::optional<Decoded> Decoded::get(std::string_view key) const { return as_view().get(key); }
std::optional<Decoded> Decoded::get(std::size_t index) const { return as_view().get(index); }

static void verify_record(const Record& r, const std::string& prefix) {
    const Buffer& buf = *r.buffer();
    for (const auto& f : r.fields()) {
        const std::string label = field_label(r.kind(), f);
        std::string path = prefix.empty() ? label : prefix + "." + label;
        if (f.is_composite()) {
            verify_record(*f.child, path);
            continue;
        }
        if (!f.has_crc32) continue;
        std::uint32_t got = crc32_bytes(buf.data() + f.offset, static_cast<std::size_t>(f.length));
        if (got != f.crc32) {
            std::ostringstream oss;
            oss << "field CRC mismatch for '" << path << "': expected " << upper_hex8(f.crc32) << ", got " << upper_hex8(got);
            throw BboError(ErrorKind::ChecksumMismatch, oss.str());
        }
    }
}

void verify(const View& view) {
    verify_record(view.record(), "");
}

// ------------------------------
// JSON bridge
// ------------------------------

namespace internal {

class JsonParser {
public:
    explicit JsonParser(std::string_view s) : s_(s) {}

    Value parse() {
        skip_ws();
        Value out = parse_value(0);
        skip_ws();
        if (pos_ != s_.size()) {
            throw BboError(ErrorKind::JsonParse, "trailing data in JSON at offset " + std::to_string(pos_));
        }
        return out;
    }

private:
    std::string_view s_;
    std::size_t pos_{0};

    void skip_ws() {
        while (pos_ < s_.size()) {
            char c = s_[pos_];
            if (c == ' ' || c == '\n' || c == '\r' || c == '\t') {
                ++pos_;
                continue;
            }
            break;
        }
    }

    char peek() const { return pos_ < s_.size() ? s_[pos_] : '\0'; }

    char get() {
        if (pos_ >= s_.size()) {
            throw BboError(ErrorKind::JsonParse, "unexpected end of JSON");
        }
        return s_[pos_++];
    }

    static void append_utf8(std::string& out, unsigned codepoint) {
        if (codepoint <= 0x7F) {
            out.push_back(static_cast<char>(codepoint));
        } else if (codepoint <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((codepoint >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        } else if (codepoint <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | ((codepoint >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((codepoint >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        }
    }

    unsigned parse_hex4() {
        unsigned v = 0;
        for (int i = 0; i < 4; ++i) {
            char c = get();
            v <<= 4;
            if (c >= '0' && c <= '9') v |= static_cast<unsigned>(c - '0');
            else if (c >= 'a' && c <= 'f') v |= static_cast<unsigned>(10 + (c - 'a'));
            else if (c >= 'A' && c <= 'F') v |= static_cast<unsigned>(10 + (c - 'A'));
            else throw BboError(ErrorKind::JsonParse, "invalid \\u escape");
        }
        return v;
    }

    std::string parse_string() {
        // assumes opening quote already consumed
        std::string out;
        while (true) {
            char c = get();
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) {
                throw BboError(ErrorKind::JsonParse, "unescaped control character in JSON string");
            }
            if (c == '\\') {
                char e = get();
                switch (e) {
                    case '"': out.push_back('"'); break;
                    case '\\': out.push_back('\\'); break;
                    case '/': out.push_back('/'); break;
                    case 'b': out.push_back('\b'); break;
                    case 'f': out.push_back('\f'); break;
                    case 'n': out.push_back('\n'); break;
                    case 'r': out.push_back('\r'); break;
                    case 't': out.push_back('\t'); break;
                    case 'u': {
                        unsigned u = parse_hex4();
                        if (u >= 0xD800 && u <= 0xDBFF) {
                            if (get() != '\\' || get() != 'u') {
                                throw BboError(ErrorKind::JsonParse, "invalid surrogate pair");
                            }
                            unsigned u2 = parse_hex4();
                            if (u2 < 0xDC00 || u2 > 0xDFFF) {
                                throw BboError(ErrorKind::JsonParse, "invalid surrogate pair");
                            }
                            append_utf8(out, 0x10000 + (((u - 0xD800) << 10) | (u2 - 0xDC00)));
                        } else if (u >= 0xDC00 && u <= 0xDFFF) {
                            throw BboError(ErrorKind::JsonParse, "unpaired low surrogate");
                        } else {
                            append_utf8(out, u);
                        }
                        break;
                    }
                    default:
                        throw BboError(ErrorKind::JsonParse, "invalid escape in JSON string");
                }
            } else {
                out.push_back(c);
            }
        }
        if (!utf8_length(out)) {
            throw BboError(ErrorKind::JsonParse, "JSON string is not valid UTF-8");
        }
        return out;
    }

    static bool is_digit(char c) { return c >= '0' && c <= '9'; }

    Value parse_number() {
        std::size_t start = pos_;
        if (peek() == '-') ++pos_;
        if (!is_digit(peek())) throw BboError(ErrorKind::JsonParse, "invalid number in JSON");
        if (peek() == '0') {
            ++pos_;
        } else {
            while (is_digit(peek())) ++pos_;
        }
        if (peek() == '.') {
            ++pos_;
            if (!is_digit(peek())) throw BboError(ErrorKind::JsonParse, "invalid number in JSON");
            while (is_digit(peek())) ++pos_;
        }
        if (peek() == 'e' || peek() == 'E') {
            ++pos_;
            if (peek() == '+' || peek() == '-') ++pos_;
            if (!is_digit(peek())) throw BboError(ErrorKind::JsonParse, "invalid number in JSON");
            while (is_digit(peek())) ++pos_;
        }

        std::string raw(s_.substr(start, pos_ - start));
        std::istringstream iss(raw);
        iss.imbue(std::locale::classic());
        double v = 0.0;
        iss >> v;
        if (iss.fail() || !std::isfinite(v)) {
            throw BboError(ErrorKind::JsonParse, "number out of range in JSON: " + raw);
        }
        return Value::make_number(v);
    }

    Value parse_array(std::size_t depth) {
        // assumes '[' consumed
        Value arr = Value::make_array();
        skip_ws();
        if (peek() == ']') {
            get();
            return arr;
        }
        while (true) {
            skip_ws();
            arr.push(parse_value(depth + 1));
            skip_ws();
            char c = get();
            if (c == ']') break;
            if (c != ',') throw BboError(ErrorKind::JsonParse, "expected ',' in array");
        }
        return arr;
    }

    Value parse_object(std::size_t depth) {
        // assumes '{' consumed
        Value obj = Value::make_object();
        skip_ws();
        if (peek() == '}') {
            get();
            return obj;
        }
        while (true) {
            skip_ws();
            if (get() != '"') throw BboError(ErrorKind::JsonParse, "expected string key");
            std::string key = parse_string();
            skip_ws();
            if (get() != ':') throw BboError(ErrorKind::JsonParse, "expected ':' in object");
            skip_ws();
            obj.set(std::move(key), parse_value(depth + 1));
            skip_ws();
            char c = get();
            if (c == '}') break;
            if (c != ',') throw BboError(ErrorKind::JsonParse, "expected ',' in object");
        }
        return obj;
    }

    Value parse_value(std::size_t depth) {
        if (depth > kMaxJsonDepth) throw BboError(ErrorKind::JsonParse, "JSON nesting too deep");
        skip_ws();
        char c = peek();
        if (c == '"') { get(); return Value::make_string(parse_string()); }
        if (c == '{') { get(); return parse_object(depth); }
        if (c == '[') { get(); return parse_array(depth); }
        if (c == 't') { expect("true"); return Value::make_boolean(true); }
        if (c == 'f') { expect("false"); return Value::make_boolean(false); }
        if (c == 'n') { expect("null"); return Value::make_null(); }
        return parse_number();
    }

    void expect(const char* lit) {
        std::size_t n = std::strlen(lit);
        if (pos_ + n > s_.size() || s_.substr(pos_, n) != lit) {
            throw BboError(ErrorKind::JsonParse, std::string("expected '") + lit + "'");
        }
        pos_ += n;
    }
};

static void json_escape_string(std::ostream& os, const std::string& s) {
    os << '"';
    for (unsigned char c : s) {
        switch (c) {
            case '"': os << "\\\""; break;
            case '\\': os << "\\\\"; break;
            case '\b': os << "\\b"; break;
            case '\f': os << "\\f"; break;
            case '\n': os << "\\n"; break;
            case '\r': os << "\\r"; break;
            case '\t': os << "\\t"; break;
            default:
                if (c < 0x20) {
                    os << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                       << static_cast<int>(c) << std::dec << std::setw(0);
                } else {
                    os << static_cast<char>(c);
                }
        }
    }
    os << '"';
}

static void json_number(std::ostream& os, double d) {
    if (!std::isfinite(d)) {
        os << "null";
    } else if (d == 0.0 && std::signbit(d)) {
        os << "-0";
    } else if (std::trunc(d) == d && std::fabs(d) <= 9007199254740992.0) {
        os << static_cast<std::int64_t>(d);
    } else {
        os << std::setprecision(17) << d;
    }
}

static void json_serialize(std::ostream& os, const Value& v) {
    switch (v.type()) {
        case ValueType::Null: os << "null"; break;
        case ValueType::Boolean: os << (std::get<bool>(v.v) ? "true" : "false"); break;
        case ValueType::Number: json_number(os, std::get<double>(v.v)); break;
        case ValueType::String: json_escape_string(os, std::get<std::string>(v.v)); break;
        case ValueType::Object: {
            os << '{';
            bool first = true;
            for (const auto& kv : std::get<Value::Object>(v.v)) {
                if (!first) os << ',';
                first = false;
                json_escape_string(os, kv.first);
                os << ':';
                json_serialize(os, kv.second);
            }
            os << '}';
            break;
        }
        case ValueType::Array: {
            const auto& arr = std::get<Value::Array>(v.v);
            os << '[';
            for (std::size_t i = 0; i < arr.size(); ++i) {
                if (i) os << ',';
                json_serialize(os, arr[i]);
            }
            os << ']';
            break;
        }
    }
}

static void json_serialize(std::ostream& os, const View& view);

static void json_serialize(std::ostream& os, const Decoded& d) {
    switch (d.v.index()) {
        case 0: os << "null"; break;
        case 1: os << (std::get<bool>(d.v) ? "true" : "false"); break;
        case 2: json_number(os, std::get<double>(d.v)); break;
        case 3: json_escape_string(os, std::get<std::string>(d.v)); break;
        default: json_serialize(os, std::get<View>(d.v)); break;
    }
}

static void json_serialize(std::ostream& os, const View& view) {
    const bool is_obj = view.is_object();
    os << (is_obj ? '{' : '[');
    const std::size_t n = view.size();
    for (std::size_t i = 0; i < n; ++i) {
        if (i) os << ',';
        if (is_obj) {
            const FieldDescriptor* f = view.record().at(i);
            json_escape_string(os, f->name);
            os << ':';
            json_serialize(os, *view.get(f->name));
        } else {
            json_serialize(os, *view.get(i));
        }
    }
    os << (is_obj ? '}' : ']');
}

template <typename T>
static std::string json_dump_compact(const T& root) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    json_serialize(oss, root);
    return oss.str();
}

} // namespace internal

Value parse_json(std::string_view text) {
    internal::JsonParser p(text);
    return p.parse();
}

std::string to_json(const Value& value) {
    return internal::json_dump_compact(value);
}

std::string to_json(const View& view) {
    return internal::json_dump_compact(view);
}

} // namespace bufobj
