#include <cstddef>
#include <cstdio>
#include <iostream>
#include <vector>

#include "oscwire/OSCWire.h"

namespace {
    void dumpBytes(const std::vector<std::byte> &bytes) {
        for (size_t i = 0; i < bytes.size(); ++i) {
            std::printf("%02x%s", std::to_integer<unsigned>(bytes[i]), (i % 16 == 15) ? "\n" : " ");
        }
        std::printf("\n");
    }
}  // namespace

int main() {
    try {
        // Create an OSC message with various argument types
        oscwire::Message msg("/test/path");
        msg.addInt32(42);
        msg.addFloat(3.14159f);
        msg.addString("Hello, OSC!");

        std::vector<std::byte> bytes = msg.serialize();
        std::cout << "Message " << msg.getPath() << " " << msg.getTypeTags() << " ("
                  << bytes.size() << " bytes):" << std::endl;
        dumpBytes(bytes);

        // Note on, middle C, velocity 100 plus an array of channel levels
        oscwire::Message msg2("/test/types");
        msg2.addInt64(1000000000000LL)
            .addDouble(2.718281828459045)
            .addBool(true)
            .addChar('X')
            .addMidi(0, 0x90, 60, 100)
            .addArray({oscwire::Value(0.5f), oscwire::Value(0.25f), oscwire::Value(1.0f)});

        // Bundle both for execution one second from now
        oscwire::TimeTag when(oscwire::TimeTag::now().seconds() + 1, 0);
        oscwire::Bundle bundle(when);
        bundle.addMessage(msg).addMessage(msg2);

        std::vector<std::byte> bundleBytes = bundle.serialize();
        std::cout << "Bundle with " << bundle.size() << " messages (" << bundleBytes.size()
                  << " bytes):" << std::endl;
        dumpBytes(bundleBytes);

        // Decode it again through the packet entry point
        oscwire::Packet packet = oscwire::Packet::deserialize(bundleBytes);
        packet.asBundle().forEach([](const oscwire::Message &message) {
            std::cout << "  " << message.getPath() << " " << message.getTypeTags() << std::endl;
        });

        std::cout << "Round trip " << (packet.asBundle() == bundle ? "matches" : "differs")
                  << std::endl;
        return 0;
    } catch (const oscwire::OSCException &e) {
        std::cerr << "OSC Exception: " << e.what() << " (Code: " << static_cast<int>(e.code())
                  << ")" << std::endl;
    } catch (const std::exception &e) {
        std::cerr << "Exception: " << e.what() << std::endl;
    }

    return 1;
}
