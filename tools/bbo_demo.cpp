#include "bufobj/bbo_easy.hpp"

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>


static void print_field(const bufobj::View& view, const std::string& path) {
    auto d = view.find(path);
    std::cout << "  " << path << " = ";
    if (!d) {
        std::cout << "<absent>\n";
        return;
    }
    switch (d->type()) {
        case bufobj::ValueType::Number: std::cout << d->as_number(); break;
        case bufobj::ValueType::Boolean: std::cout << (d->as_boolean() ? "true" : "false"); break;
        case bufobj::ValueType::String: std::cout << '"' << d->as_string() << '"'; break;
        case bufobj::ValueType::Null: std::cout << "null"; break;
        default:
            std::cout << "<" << bufobj::to_string(d->type()) << " with "
                      << d->as_view().size() << " fields>";
            break;
    }
    std::cout << "\n";
}

int main() {
    try {
        using namespace bufobj;
        using namespace bufobj::easy;

        Value root = object({
            {"someNumber", num(123)},
            {"anotherFpNumber", num(123.45)},
            {"boolTrue", boolean(true)},
            {"boolFalse", boolean(false)},
            {"someString", str("hello world")},
            {"someUnicodeString", str("привіт друже як справи?")},
            {"pureUnicodeEmojisString", str("🦴🙍☹😔🤬😡")},
            {"nestedObject", object({
                {"key", str("value")},
                {"anotherKey", object({{"with", str("nested value")}})},
            })},
            {"samples", numbers(std::vector<int>{3, 1, 4, 1, 5})},
        });

        std::cout << "estimate: exact=" << estimate(root)
                  << " conservative=" << estimate(root, Sizing::Conservative) << " bytes\n";

        ReadOptions ro;
        ro.validate = true;
        View view = encode(root, EncodeOptions{}, ro);

        std::cout << "Encoded " << view.size() << " top-level fields into "
                  << view.record().buffer()->size() << " bytes\n";
        for (const auto& f : view.record().fields()) {
            std::cout << "  [" << f.offset << ", +" << f.length << ") "
                      << to_string(f.type) << " " << f.name << "\n";
        }

        std::cout << "Lazy reads:\n";
        print_field(view, "someNumber");
        print_field(view, "anotherFpNumber");
        print_field(view, "boolTrue");
        print_field(view, "boolFalse");
        print_field(view, "someString");
        print_field(view, "someUnicodeString");
        print_field(view, "pureUnicodeEmojisString");
        print_field(view, "nestedObject.key");
        print_field(view, "nestedObject.anotherKey.with");
        print_field(view, "nestedObject.anotherKey");
        print_field(view, "samples.2");
        print_field(view, "missing");

        verify(view);
        std::cout << "JSON: " << to_json(view) << "\n";
        std::cout << "OK\n";
        return 0;

    } catch (const bufobj::BboError& e) {
        std::cerr << "bufobj error (" << bufobj::to_string(e.kind()) << "): " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
