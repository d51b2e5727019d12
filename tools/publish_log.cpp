#include "raffle_config.hpp"
#include "sodium_util.hpp"

#include <sodium.h>

#include <exception>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void writeJson(const std::string& path, const std::string& jsonPayload) {
    if (path.empty()) {
        std::cout << jsonPayload;
        return;
    }
    std::ofstream ofs(path);
    if (!ofs) {
        throw std::runtime_error("Unable to open output path: " + path);
    }
    ofs << jsonPayload;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 4) {
        std::cerr << "Usage: publish_log <round_id> <event_log_root> <ed25519_secret_key_hex> [output.json]\n";
        std::cerr << "Environment: RAFFLE_DEPLOYMENT_ID is required; optional RAFFLE_CHAIN_ID adds chain scoping.\n";
        return 1;
    }

    std::string roundId = argv[1];
    std::string logRoot = argv[2];
    std::string outputPath = (argc >= 5) ? argv[4] : "";

    try {
        raffle::requireSodium();
        raffle::DeploymentScope scope = raffle::requireDeploymentScope();

        raffle::SecretBytes secretKey(raffle::hexToBytes(argv[3]));
        if (secretKey.size() != crypto_sign_SECRETKEYBYTES) {
            std::cerr << "Secret key must be " << crypto_sign_SECRETKEYBYTES
                      << " bytes (hex encoded)\n";
            return 1;
        }

        std::vector<unsigned char> publicKey(crypto_sign_PUBLICKEYBYTES);
        if (crypto_sign_ed25519_sk_to_pk(publicKey.data(), secretKey.data()) != 0) {
            std::cerr << "Unable to derive public key from secret key\n";
            return 1;
        }

        std::string message = scope.deploymentId + ":";
        if (!scope.chainId.empty()) {
            message += scope.chainId + ":";
        }
        message += roundId + ":" + logRoot;

        std::vector<unsigned char> signature(crypto_sign_BYTES);
        unsigned long long sigLen = 0;
        if (crypto_sign_detached(signature.data(),
                                 &sigLen,
                                 reinterpret_cast<const unsigned char*>(message.data()),
                                 message.size(),
                                 secretKey.data()) != 0) {
            std::cerr << "Signing failed\n";
            return 1;
        }

        std::ostringstream json;
        json << "{\n";
        json << "  \"round_id\": \"" << roundId << "\",\n";
        json << "  \"event_log_root\": \"" << logRoot << "\",\n";
        json << "  \"deployment_id\": \"" << scope.deploymentId << "\"";
        if (!scope.chainId.empty()) {
            json << ",\n  \"chain_id\": \"" << scope.chainId << "\"";
        }
        json << ",\n  \"signature\": \"" << raffle::bytesToHex(signature.data(), sigLen) << "\",\n";
        json << "  \"public_key\": \"" << raffle::bytesToHex(publicKey.data(), publicKey.size())
             << "\"\n";
        json << "}\n";

        writeJson(outputPath, json.str());
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << "\n";
        return 1;
    }
    return 0;
}
