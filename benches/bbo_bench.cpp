#include "bufobj/bbo.hpp"

#include <chrono>
#include <iostream>
#include <random>
#include <string>
#include <vector>

static double ms_since(const std::chrono::high_resolution_clock::time_point& t0) {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(high_resolution_clock::now() - t0).count();
}

static bufobj::Value make_payload(std::size_t rows, std::size_t cols) {
    using bufobj::Value;

    std::mt19937_64 rng(123);
    std::uniform_real_distribution<double> dist(0.0, 1.0);

    Value root = Value::make_object();
    Value table = Value::make_array();
    for (std::size_t r = 0; r < rows; ++r) {
        Value row = Value::make_object();
        row.set("id", Value::make_number(static_cast<double>(r)));
        row.set("label", Value::make_string("row-" + std::to_string(r) + "-\xCE\xB1\xCE\xB2\xCE\xB3"));
        row.set("active", Value::make_boolean(r % 3 == 0));
        row.set("note", Value::make_null());
        Value cells = Value::make_array();
        for (std::size_t c = 0; c < cols; ++c) cells.push(Value::make_number(dist(rng)));
        row.set("cells", std::move(cells));
        table.push(std::move(row));
    }
    root.set("table", std::move(table));
    root.set("name", Value::make_string("bench"));
    return root;
}

static void bench_one(bufobj::Sizing sizing, bool crc) {
    const std::size_t rows = 20000;
    const std::size_t cols = 16;
    bufobj::Value root = make_payload(rows, cols);

    bufobj::EncodeOptions eo;
    eo.sizing = sizing;
    eo.include_crc32 = crc;

    std::cout << "=== " << (sizing == bufobj::Sizing::Exact ? "sizing=exact" : "sizing=conservative")
              << (crc ? " crc32=on" : " crc32=off") << " ===\n";

    auto t0 = std::chrono::high_resolution_clock::now();
    bufobj::View view = bufobj::encode(root, eo);
    double e_ms = ms_since(t0);

    double mb = static_cast<double>(view.record().buffer()->size()) / (1024.0 * 1024.0);
    std::cout << "encode : " << e_ms << " ms, buffer=" << mb << " MiB\n";

    t0 = std::chrono::high_resolution_clock::now();
    double sum = 0.0;
    auto table = view.get("table")->as_view();
    for (std::size_t r = 0; r < rows; r += 97) {
        sum += table.get(r)->get("cells")->get(std::size_t{7})->as_number();
    }
    double l_ms = ms_since(t0);
    std::cout << "lazy   : " << l_ms << " ms for " << (rows / 97 + 1) << " point reads (sum=" << sum << ")\n";

    t0 = std::chrono::high_resolution_clock::now();
    bufobj::Value back = view.materialize();
    double m_ms = ms_since(t0);
    std::cout << "full   : " << m_ms << " ms materialize of " << back.as_object().size() << " top-level fields, throughput=" << (mb / (m_ms / 1000.0)) << " MiB/s\n";
}

int main() {
    try {
        bench_one(bufobj::Sizing::Exact, false);
        bench_one(bufobj::Sizing::Exact, true);
        bench_one(bufobj::Sizing::Conservative, true);
    } catch (const bufobj::BboError& e) {
        std::cerr << "bufobj error (" << bufobj::to_string(e.kind()) << "): " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
