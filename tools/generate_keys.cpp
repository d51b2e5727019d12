#include "vrf_coordinator.hpp"

#include <exception>
#include <iostream>

int main(int argc, char* argv[]) {
    try {
        raffle::VrfKeyPair keys = (argc > 1) ? raffle::deriveVrfKeypairFromSeed(argv[1])
                                             : raffle::generateVrfKeypair();
        std::cout << "public_key=" << keys.publicKeyHex << '\n';
        std::cout << "secret_key=" << keys.secretKeyHex << '\n';
    } catch (const std::exception& ex) {
        std::cerr << "Key generation failed: " << ex.what() << '\n';
        std::cerr << "Usage: generate_keys [seedHex]\n";
        return 1;
    }
    return 0;
}
