#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace bufobj {

// ------------------------------
// Error model
// ------------------------------

enum class ErrorKind {
    UnsupportedType,
    SizeUnderestimate,
    DecodeError,
    ChecksumMismatch,
    TypeMismatch,
    InvalidData,
    JsonParse,
};

std::string to_string(ErrorKind k);

class BboError : public std::runtime_error {
public:
    BboError(ErrorKind k, const std::string& msg);
    ErrorKind kind() const noexcept;

private:
    ErrorKind kind_;
};

// ------------------------------
// Public data model
// ------------------------------

enum class ValueType {
    Number,
    Boolean,
    String,
    Null,
    Object,
    Array,
};

std::string to_string(ValueType t);
ValueType value_type_from_string(const std::string& s);

struct Value {
    // Insertion-ordered; keys are unique.
    using Object = std::vector<std::pair<std::string, Value>>;
    using Array = std::vector<Value>;

    std::variant<
        std::nullptr_t,
        bool,
        double,
        std::string,
        Object,
        Array
    > v;

    // Convenience constructors
    static Value make_null();
    static Value make_boolean(bool b);
    static Value make_number(double d);
    static Value make_string(std::string s);
    static Value make_object();
    static Value make_object(Object members);
    static Value make_array();
    static Value make_array(Array items);

    ValueType type() const;

    bool is_null() const noexcept;
    bool is_boolean() const noexcept;
    bool is_number() const noexcept;
    bool is_string() const noexcept;
    bool is_object() const noexcept;
    bool is_array() const noexcept;

    bool as_boolean() const;
    double as_number() const;
    const std::string& as_string() const;
    const Object& as_object() const;
    Object& as_object();
    const Array& as_array() const;
    Array& as_array();

    /// Object member lookup; nullptr when absent.
    const Value* get(std::string_view key) const;

    /// Insert or replace an object member. A replaced key keeps its position.
    Value& set(std::string key, Value member);

    /// Append an array element.
    Value& push(Value item);
};

bool operator==(const Value& a, const Value& b);
bool operator!=(const Value& a, const Value& b);

using Buffer = std::vector<std::uint8_t>;

class Record;

struct FieldDescriptor {
    std::string name{};          // object key; empty for array elements
    std::size_t index{0};        // position inside the parent record
    ValueType type{ValueType::Null};
    std::uint64_t offset{0};     // absolute within the shared buffer
    std::uint64_t length{0};     // leaf byte length, or byte span of the child region
    std::uint32_t crc32{0};
    bool has_crc32{false};       // crc32 is meaningful only when set
    std::shared_ptr<const Record> child{}; // set for Object/Array only

    bool is_composite() const noexcept {
        return type == ValueType::Object || type == ValueType::Array;
    }
};

// One object or array level over a shared buffer.
// Populated while encoding, then only handed out as shared_ptr<const Record>.
class Record {
public:
    Record(std::shared_ptr<const Buffer> buffer, ValueType kind, std::uint64_t offset);

    ValueType kind() const noexcept { return kind_; }
    const std::shared_ptr<const Buffer>& buffer() const noexcept { return buffer_; }

    // Region covered by this record's fields (including nested records).
    std::uint64_t offset() const noexcept { return offset_; }
    std::uint64_t length() const noexcept { return length_; }

    std::size_t size() const noexcept { return fields_.size(); }
    const std::vector<FieldDescriptor>& fields() const noexcept { return fields_; }

    /// Object field by name; nullptr when absent (or when this is an array).
    const FieldDescriptor* find(std::string_view name) const;
    /// Field by position; nullptr when out of range.
    const FieldDescriptor* at(std::size_t index) const;

    /// Append a descriptor, checking the layout invariants. Throws InvalidData.
    void add_field(FieldDescriptor f);

private:
    std::shared_ptr<const Buffer> buffer_;
    ValueType kind_;
    std::uint64_t offset_{0};
    std::uint64_t length_{0};
    std::vector<FieldDescriptor> fields_{};
    std::map<std::string, std::size_t, std::less<>> by_name_{};
};

// ------------------------------
// Options
// ------------------------------

enum class Sizing {
    Exact,        // same accounting as the encoder
    Conservative, // fixed per-type widths, always >= Exact
};

struct EncodeOptions {
    Sizing sizing{Sizing::Exact};
    bool include_crc32{true}; // per-leaf CRC-32 (zlib)
};

// Called with the byte range a decode reads.
using AccessHook = std::function<void(std::uint64_t offset, std::uint64_t length)>;

struct ReadOptions {
    bool validate{false}; // check per-leaf CRC before decoding (when present)
    AccessHook on_read{};
};

// ------------------------------
// Lazy view
// ------------------------------

struct Decoded;

class View {
public:
    View() = default;
    explicit View(std::shared_ptr<const Record> record, ReadOptions opts = ReadOptions{});

    bool valid() const noexcept { return static_cast<bool>(record_); }
    ValueType kind() const;
    bool is_object() const;
    bool is_array() const;
    std::size_t size() const;

    const Record& record() const;
    const ReadOptions& options() const noexcept { return opts_; }

    /// Decode one object field. std::nullopt => absent key.
    std::optional<Decoded> get(std::string_view key) const;
    /// Decode one array element. std::nullopt => index out of range.
    std::optional<Decoded> get(std::size_t index) const;

    /// Dot-separated path, numeric segments index arrays ("items.2.name").
    std::optional<Decoded> find(const std::string& path) const;

    std::vector<std::string> keys() const;

    /// Decode the whole subtree.
    Value materialize() const;

private:
    Decoded decode(const FieldDescriptor& f) const;

    std::shared_ptr<const Record> record_{};
    ReadOptions opts_{};
};

struct Decoded {
    std::variant<std::nullptr_t, bool, double, std::string, View> v;

    ValueType type() const;

    bool is_null() const noexcept { return std::holds_alternative<std::nullptr_t>(v); }
    bool is_boolean() const noexcept { return std::holds_alternative<bool>(v); }
    bool is_number() const noexcept { return std::holds_alternative<double>(v); }
    bool is_string() const noexcept { return std::holds_alternative<std::string>(v); }
    bool is_view() const noexcept { return std::holds_alternative<View>(v); }

    bool as_boolean() const;
    double as_number() const;
    const std::string& as_string() const;
    const View& as_view() const;

    // Shorthand for as_view().get(...)
    std::optional<Decoded> get(std::string_view key) const;
    std::optional<Decoded> get(std::size_t index) const;
};

// ------------------------------
// API
// ------------------------------

/// Upper bound (exact for Sizing::Exact) on the bytes encode() writes for `value`.
std::size_t estimate(const Value& value, Sizing sizing = Sizing::Exact);

/// Encode an object or array into one freshly allocated buffer; returns the root record.
std::shared_ptr<const Record> encode_record(
    const Value& value,
    const EncodeOptions& opts = EncodeOptions{}
);

/// Encode and wrap the root record in a view.
View encode(
    const Value& value,
    const EncodeOptions& opts = EncodeOptions{},
    const ReadOptions& read_opts = ReadOptions{}
);

/// Check every stored CRC in the subtree. Throws ChecksumMismatch.
void verify(const View& view);

// ------------------------------
// JSON bridge
// ------------------------------

Value parse_json(std::string_view text);
std::string to_json(const Value& value);
std::string to_json(const View& view);

// ------------------------------
// Utilities
// ------------------------------

/// Number of code points in `s`, or std::nullopt when `s` is not valid UTF-8.
std::optional<std::size_t> utf8_length(std::string_view s);

} // namespace bufobj
