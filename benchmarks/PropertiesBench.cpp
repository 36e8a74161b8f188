#include <chrono>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "../src/store/OrderedProperties.hpp"
#include "../src/store/PropertiesSnapshot.hpp"
#include "../tests/TestHelpers.hpp"

struct BenchmarkResult {
    std::string name;
    size_t operations;
    double duration_ms;
    size_t bytes = 0; // text or snapshot bytes processed, 0 if not applicable
};

OrderedProperties makeProperties(size_t count, bool suppressDate) {
    auto props = OrderedPropertiesBuilder().withSuppressDateInComment(suppressDate).build();
    for (size_t i = 0; i < count; ++i) {
        props.set("section." + std::to_string(i) + ".key",
                  " value with spaces, = and : and caf\xC3\xA9 #" + std::to_string(i));
    }
    return props;
}

BenchmarkResult benchSet(size_t iterations) {
    auto start = std::chrono::steady_clock::now();
    OrderedProperties props = makeProperties(iterations, false);
    auto end = std::chrono::steady_clock::now();

    if (props.size() != static_cast<int>(iterations))
        std::cerr << "unexpected size " << props.size() << "\n";

    double duration_ms = std::chrono::duration<double, std::milli>(end - start).count();
    return {"set (insertion order)", iterations, duration_ms};
}

BenchmarkResult benchStore(size_t iterations, Encoding encoding, const char* name) {
    OrderedProperties props = makeProperties(iterations, true);

    auto start = std::chrono::steady_clock::now();
    std::string text = storeToString(props, std::string("benchmark"), encoding);
    auto end = std::chrono::steady_clock::now();

    if (text.empty())
        std::cerr << "store produced no output\n";

    double duration_ms = std::chrono::duration<double, std::milli>(end - start).count();
    return {name, iterations, duration_ms, text.size()};
}

BenchmarkResult benchLoad(size_t iterations, Encoding encoding, const char* name) {
    std::string text = storeToString(makeProperties(iterations, true), std::string("benchmark"), encoding);

    auto start = std::chrono::steady_clock::now();
    OrderedProperties props = loadFrom(text, encoding);
    auto end = std::chrono::steady_clock::now();

    if (props.size() != static_cast<int>(iterations))
        std::cerr << "unexpected size " << props.size() << " after load\n";

    double duration_ms = std::chrono::duration<double, std::milli>(end - start).count();
    return {name, iterations, duration_ms, text.size()};
}

BenchmarkResult benchSnapshot(size_t iterations) {
    OrderedProperties props = makeProperties(iterations, false);

    auto start = std::chrono::steady_clock::now();
    std::stringstream buffer;
    PropertiesSnapshot::write(props, buffer);
    OrderedProperties restored = PropertiesSnapshot::read(buffer);
    auto end = std::chrono::steady_clock::now();

    if (restored != props)
        std::cerr << "snapshot round-trip mismatch\n";

    double duration_ms = std::chrono::duration<double, std::milli>(end - start).count();
    return {"snapshot write+read", iterations, duration_ms, buffer.str().size()};
}

void printResults(const std::vector<BenchmarkResult>& results, size_t entries) {
    std::cout << "Properties micro-benchmarks (" << entries << " entries)" << std::endl;
    std::cout << std::string(78, '-') << std::endl;
    std::cout << std::left << std::setw(26) << "Benchmark"
              << std::right << std::setw(18) << "Entries/s"
              << std::setw(16) << "MiB/s"
              << std::setw(18) << "Duration (ms)" << std::endl;

    for (const auto& res : results) {
        double seconds = res.duration_ms / 1000.0;
        std::cout << std::left << std::setw(26) << res.name
                  << std::right << std::fixed << std::setprecision(0)
                  << std::setw(18) << res.operations / seconds;
        if (res.bytes > 0)
            std::cout << std::setw(16) << std::setprecision(2)
                      << res.bytes / seconds / (1024.0 * 1024.0);
        else
            std::cout << std::setw(16) << "-";
        std::cout << std::setw(18) << std::setprecision(3) << res.duration_ms << std::endl;
    }
}

int main(int argc, char** argv) {
    std::cout << std::unitbuf;
    std::cerr << std::unitbuf;

    size_t iterations = 20000;
    if (argc > 1) {
        long parsed = std::strtol(argv[1], nullptr, 10);
        if (parsed <= 0) {
            std::cerr << "usage: " << argv[0] << " [entries]\n";
            return 1;
        }
        iterations = static_cast<size_t>(parsed);
    }

    std::vector<BenchmarkResult> results;
    try {
        results.push_back(benchSet(iterations));
        results.push_back(benchStore(iterations, Encoding::LATIN1, "store (latin-1)"));
        results.push_back(benchStore(iterations, Encoding::UTF8, "store (utf-8)"));
        results.push_back(benchLoad(iterations, Encoding::LATIN1, "load (latin-1)"));
        results.push_back(benchLoad(iterations, Encoding::UTF8, "load (utf-8)"));
        results.push_back(benchSnapshot(iterations));
    } catch (const std::exception& e) {
        std::cerr << "benchmark failed: " << e.what() << "\n";
        return 1;
    }

    printResults(results, iterations);
    return 0;
}
