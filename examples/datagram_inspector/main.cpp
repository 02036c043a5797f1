#include <sanitation/sanitation.hpp>
#include <sanitation/archive.hpp>

#include <cereal/archives/binary.hpp>
#include <cereal/types/string.hpp>

#include <asio.hpp>

#include <array>
#include <csignal>
#include <fstream>
#include <iostream>
#include <string>

/** Prints every datagram it receives through the sanitized views. Datagrams carrying garbage can be captured to a file. */
class datagram_inspector {
public:
    datagram_inspector(asio::io_context& io, unsigned short port, std::ostream* capture) :
        socket(io, asio::ip::udp::endpoint(asio::ip::udp::v4(), port)),
        sender_endpoint(),
        buffer(),
        capture(capture),
        datagrams(0),
        flagged(0) {}

    void listen() {
        std::cout << "Listening on " << socket.local_endpoint() << std::endl;
        receive();
    }

    void stop() {
        socket.close();
        std::cout << datagrams << " datagrams, " << flagged << " with garbage" << std::endl;
    }

private:
    void receive() {
        socket.async_receive_from(asio::buffer(buffer), sender_endpoint, [this](asio::error_code ec, std::size_t size) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    std::cerr << "Receive failed: " << ec.message() << std::endl;
                }
                return;
            }

            auto b = reinterpret_cast<const sanitation::byte*>(buffer.data());
            auto datagram = sanitation::sanitized_buffer(b, b + size);

            report(datagram);
            receive();
        });
    }

    void report(const sanitation::sanitized_buffer& datagram) {
        ++datagrams;

        std::cout << sender_endpoint << " (" << datagram.size() << " bytes): " << datagram.soft_text() << "\n";

        if (datagram.has_garbage()) {
            ++flagged;

            std::cout << "  garbage (" << datagram.garbage_size() << " bytes): " << datagram.garbage_hex() << "\n";
            for (auto& span : datagram.garbage_spans()) {
                std::cout << "    at [" << span.begin << ", " << span.end << ")\n";
            }

            if (capture) {
                auto archive = cereal::BinaryOutputArchive(*capture);
                auto sender = sender_endpoint.address().to_string();
                archive(sender, datagram);
                capture->flush();
            }
        }

        std::cout << std::flush;
    }

    asio::ip::udp::socket socket;
    asio::ip::udp::endpoint sender_endpoint;
    std::array<char, 65536> buffer;
    std::ostream* capture;
    std::size_t datagrams;
    std::size_t flagged;
};

int main(int argc, char* argv[]) {
    if (argc > 3) {
        std::cerr << "Usage: " << argv[0] << " [port] [capture-file]" << std::endl;
        return 2;
    }

    auto port = 6969;

    if (argc > 1) {
        try {
            port = std::stoi(argv[1]);
        } catch (const std::exception& e) {
            std::cerr << "Invalid port " << argv[1] << ": " << e.what() << std::endl;
            return 2;
        }

        if (port < 0 || port > 65535) {
            std::cerr << "Invalid port " << argv[1] << ": out of range" << std::endl;
            return 2;
        }
    }

    auto capture_file = std::ofstream();

    if (argc > 2) {
        capture_file.open(argv[2], std::ios::binary | std::ios::app);
        if (!capture_file) {
            std::cerr << "Cannot open capture file " << argv[2] << std::endl;
            return 1;
        }
    }

    auto io = asio::io_context();

    auto inspector = datagram_inspector(io, static_cast<unsigned short>(port), capture_file.is_open() ? &capture_file : nullptr);

    auto signals = asio::signal_set(io, SIGINT, SIGTERM);
    signals.async_wait([&](asio::error_code, int) {
        inspector.stop();
    });

    inspector.listen();
    io.run();
}
