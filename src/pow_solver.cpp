#include <iostream>
#include <string>
#include <chrono>
#include "solver.hpp"
#include "difficulty.hpp"
#include "input_validator.hpp"

using namespace powgate;

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <nonce> <difficulty> [data-prefix]\n"
                  << "Searches data = <data-prefix><counter> until SHA-256(data || nonce)\n"
                  << "has <difficulty> leading zero bits.\n";
        return 1;
    }

    std::string nonce = argv[1];
    int difficulty = 0;
    try {
        difficulty = std::stoi(argv[2]);
    } catch (const std::exception&) {
        std::cerr << "[-] Invalid difficulty: " << argv[2] << std::endl;
        return 1;
    }
    std::string prefix = argc > 3 ? argv[3] : "";

    std::cout << "[*] Starting PoW Solver..." << std::endl;
    std::cout << "[*] Nonce: " << nonce << std::endl;
    std::cout << "[*] Data prefix: \"" << prefix << "\"" << std::endl;
    std::cout << "[*] Difficulty: " << difficulty << " (leading zero bits)" << std::endl;

    auto start = std::chrono::steady_clock::now();
    auto solution = solve(nonce, prefix, difficulty);
    auto end = std::chrono::steady_clock::now();
    auto diff = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();

    if (!solution) {
        std::cout << "[-] FAILED to find a solution within 10M attempts." << std::endl;
        return 2;
    }

    Bytes hash;
    if (!InputValidator::hex_decode(solution->hash_hex, hash)) {
        std::cerr << "[-] Solver produced an undecodable hash" << std::endl;
        return 1;
    }

    std::cout << "[+] SUCCESS! counter=" << solution->counter << std::endl;
    std::cout << "[+] data=" << solution->data << std::endl;
    std::cout << "[+] hash=" << solution->hash_hex << std::endl;
    std::cout << "[+] Leading zero bits: " << DifficultyEvaluator::leading_zero_bits(hash) << std::endl;
    std::cout << "[*] Total attempts: " << solution->attempts << std::endl;
    std::cout << "[*] Time taken: " << diff << "ms" << std::endl;
    if (diff > 0) {
        std::cout << "[*] Hash rate: " << (solution->attempts * 1000 / diff) << " H/s" << std::endl;
    }

    return 0;
}
