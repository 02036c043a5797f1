#include <sanitation/sanitation.hpp>

#include <iostream>

int main() {
    auto data = sanitation::byte_vector{
        0x54, 0x68, 0x65, 0x20, 0x71, 0x75, 0x69, 0x63, 0x6b, 0x20, 0x62, 0x72, 0x6f, 0x77, 0x6e,
        0x20, 0x66, 0x6f, 0x78, 0x20, 0x6a, 0x75, 0x6d, 0x70, 0x73, 0x20, 0x6f, 0x76, 0x65, 0x72,
        0x20, 0x74, 0x68, 0x65, 0x20, 0x6c, 0x61, 0x7a, 0x79, 0x20, 0x64, 0x6f, 0x67, 0xf4, 0xf1, 0xf3,
    };

    auto with_garbage = sanitation::sanitized_buffer(data);

    try {
        std::cout << with_garbage.checked_text() << " should not reach here" << std::endl;
        return 1;
    } catch (const sanitation::unsafe_string_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
    }

    std::cout << "Non-valid UTF-8 bytes:\t" << sanitation::to_hex_literal(with_garbage.garbage_bytes()) << "\n";
    std::cout << "Garbage spans:\n";
    for (auto& span : with_garbage.garbage_spans()) {
        std::cout << "  [" << span.begin << ", " << span.end << ")\n";
    }

    data.resize(data.size() - 3);

    auto clean = sanitation::sanitized_buffer(data);
    std::cout << "UTF-8 safe string:\t" << clean.checked_text() << std::endl;
}
