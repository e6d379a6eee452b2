#include "bufobj/bbo.hpp"
#include "bufobj/bbo_easy.hpp"

#include "check.hpp"

#include <cmath>
#include <cstring>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

using namespace bufobj;
using namespace bufobj::easy;

static const char* kEmoji =
    "\xF0\x9F\xA6\xB4\xF0\x9F\x99\x8D\xE2\x98\xB9\xF0\x9F\x98\x94\xF0\x9F\xA4\xAC\xF0\x9F\x98\xA1";

static Value make_sample_root() {
    return object({
        {"someNumber", num(123)},
        {"anotherFpNumber", num(123.45)},
        {"boolTrue", boolean(true)},
        {"boolFalse", boolean(false)},
        {"someString", str("hello world")},
        {"someUnicodeString", str("привіт друже як справи?")},
        {"pureUnicodeEmojisString", str(kEmoji)},
        {"nothing", null()},
        {"nestedObject", object({
            {"key", str("value")},
            {"anotherKey", object({{"with", str("nested value")}})},
        })},
        {"list", array({num(1), str("two"), boolean(false), null(), array({num(3)}), object({})})},
    });
}

static std::uint64_t bits(double d) {
    std::uint64_t u = 0;
    std::memcpy(&u, &d, sizeof(u));
    return u;
}

int main() {
    // Object scenario: every tag at the top level plus one nested object.
    {
        Value doc = object({
            {"a", num(42.5)},
            {"b", boolean(true)},
            {"c", str("hi")},
            {"d", null()},
            {"e", object({{"f", str("nested")}})},
        });
        View view = encode(doc);
        CHECK(view.is_object());
        CHECK(view.size() == 5);
        CHECK(view.get("a")->as_number() == 42.5);
        CHECK(view.get("b")->as_boolean() == true);
        CHECK(view.get("c")->as_string() == "hi");
        CHECK(view.get("d")->is_null());
        CHECK(view.get("e")->get("f")->as_string() == "nested");

        // Layout: a@0+8, b@8+1, c@9+2, d@11+0, e@11 spanning f@11+6.
        const Record& r = view.record();
        CHECK(r.find("a")->offset == 0 && r.find("a")->length == 8);
        CHECK(r.find("b")->offset == 8 && r.find("b")->length == 1);
        CHECK(r.find("c")->offset == 9 && r.find("c")->length == 2);
        CHECK(r.find("d")->offset == 11 && r.find("d")->length == 0);
        CHECK(r.find("e")->offset == 11 && r.find("e")->length == 6);
        CHECK(r.find("e")->child);
        CHECK(r.find("e")->child->find("f")->offset == 11);
        CHECK(r.length() == 17);
        CHECK(r.buffer()->size() == 17);

        // Little-endian IEEE-754 double, then 0x01 for true, then raw UTF-8.
        const Buffer& b = *r.buffer();
        const std::uint8_t expect_a[8] = {0x00, 0x00, 0x00, 0x00, 0x00, 0x40, 0x45, 0x40};
        CHECK(std::memcmp(b.data(), expect_a, 8) == 0);
        CHECK(b[8] == 0x01);
        CHECK(b[9] == 'h' && b[10] == 'i');
        CHECK(std::memcmp(b.data() + 11, "nested", 6) == 0);
    }

    // Array scenario: positional access into arrays and objects nested in them.
    {
        Value doc = object({{"arr", array({num(1), num(2), object({{"x", str("y")}})})}});
        View view = encode(doc);
        auto arr = view.get("arr");
        CHECK(arr && arr->type() == ValueType::Array);
        CHECK(arr->as_view().size() == 3);
        CHECK(arr->get(0)->as_number() == 1);
        CHECK(arr->get(1)->as_number() == 2);
        CHECK(arr->get(2)->get("x")->as_string() == "y");
        CHECK(!arr->get(3));

        const Record& ar = arr->as_view().record();
        CHECK(ar.kind() == ValueType::Array);
        CHECK(ar.at(0)->name.empty() && ar.at(0)->index == 0);
        CHECK(ar.at(2)->index == 2 && ar.at(2)->offset == 16);
        CHECK(ar.length() == 17);
    }

    // Arrays as the root record.
    {
        View view = encode(array({str("first"), num(-7), array({})}));
        CHECK(view.is_array());
        CHECK(view.get(0)->as_string() == "first");
        CHECK(view.get(1)->as_number() == -7);
        CHECK(view.get(2)->as_view().size() == 0);
    }

    // Multi-byte strings: the descriptor carries the UTF-8 byte length, not the character count.
    {
        Value doc = make_sample_root();
        View view = encode(doc);

        const std::string cyr = "привіт друже як справи?";
        CHECK(view.get("someUnicodeString")->as_string() == cyr);
        const FieldDescriptor* f = view.record().find("someUnicodeString");
        CHECK(f->length == 42);
        CHECK(utf8_length(cyr).value() == 23);

        CHECK(view.get("pureUnicodeEmojisString")->as_string() == kEmoji);
        const FieldDescriptor* e = view.record().find("pureUnicodeEmojisString");
        CHECK(e->length == 23);
        CHECK(utf8_length(kEmoji).value() == 6);

        CHECK(view.get("nestedObject")->get("anotherKey")->get("with")->as_string() == "nested value");
        CHECK(view.get("someNumber")->as_number() == 123);
        CHECK(view.get("anotherFpNumber")->as_number() == 123.45);
        CHECK(view.get("boolFalse")->as_boolean() == false);
    }

    // Whole-tree round trip.
    {
        Value doc = make_sample_root();
        View view = encode(doc);
        Value back = view.materialize();
        CHECK(back == doc);
        CHECK(view.get("list")->as_view().materialize() == *doc.get("list"));
    }

    // Numbers are bit-exact, including signed zero, NaN, infinities and subnormals.
    {
        const double specials[] = {
            -0.0,
            std::numeric_limits<double>::quiet_NaN(),
            std::numeric_limits<double>::infinity(),
            -std::numeric_limits<double>::infinity(),
            std::numeric_limits<double>::denorm_min(),
            std::numeric_limits<double>::max(),
            std::numeric_limits<double>::lowest(),
            0.1,
        };
        Value doc = Value::make_array();
        for (double d : specials) doc.push(num(d));

        View view = encode(doc);
        for (std::size_t i = 0; i < sizeof(specials) / sizeof(specials[0]); ++i) {
            CHECK(bits(view.get(i)->as_number()) == bits(specials[i]));
        }
        CHECK(view.materialize() == doc);
    }

    // Encoding the same value twice reproduces the same layout.
    {
        Value doc = make_sample_root();
        auto r1 = encode_record(doc);
        auto r2 = encode_record(doc);
        CHECK(*r1->buffer() == *r2->buffer());
        CHECK(r1->size() == r2->size());
        for (std::size_t i = 0; i < r1->size(); ++i) {
            CHECK(r1->at(i)->name == r2->at(i)->name);
            CHECK(r1->at(i)->type == r2->at(i)->type);
            CHECK(r1->at(i)->offset == r2->at(i)->offset);
            CHECK(r1->at(i)->length == r2->at(i)->length);
            CHECK(r1->at(i)->crc32 == r2->at(i)->crc32);
        }
    }

    // Builders: set replaces a member in place, numbers widens each element to a double.
    {
        Value doc = object({{"a", num(1)}, {"b", str("x")}});
        set(doc, "a", str("replaced"));
        set(doc, "c", numbers(std::vector<int>{3, -1, 4}));
        set(doc, "d", numbers(std::vector<float>{0.5f}));

        CHECK(doc.as_object().size() == 4);
        CHECK(doc.as_object()[0].first == "a");
        CHECK(doc.get("a")->as_string() == "replaced");

        View view = encode(doc);
        const std::vector<std::string> expect = {"a", "b", "c", "d"};
        CHECK(view.keys() == expect);
        CHECK(view.get("a")->as_string() == "replaced");
        CHECK(view.get("c")->as_view().size() == 3);
        CHECK(view.find("c.1")->as_number() == -1);
        CHECK(view.find("c.2")->as_number() == 4);
        CHECK(view.find("d.0")->as_number() == 0.5);
        CHECK(view.record().find("c")->length == 24);
    }

    // Input is left untouched.
    {
        Value doc = make_sample_root();
        Value copy = doc;
        (void)encode(doc);
        CHECK(doc == copy);
    }

    std::cout << "All tests passed.\n";
    return 0;
}
