/**
 * Address Database Query CLI
 *
 * Checks whether addresses are present in a seedhound address database.
 *
 * Usage:
 *   seedhound-check-db -d addresses.db 1BoatSLRHtKNngkdXEeobR76b53LETtpyT [...]
 *
 * Options:
 *   -d, --database   Database file
 *   -f, --file       Read addresses from a file ('-' for stdin)
 *   -h, --help       Show this help message
 *
 * Exit status is 0 when every queried address is present, 1 otherwise.
 */

#include "../core/address.hpp"
#include "../core/address_db.hpp"
#include "../core/errors.hpp"
#include <fstream>
#include <iostream>
#include <vector>
#include <getopt.h>

using namespace seedhound;

void print_usage(const char* prog) {
    std::cout << "Address Database Query\n"
              << "Usage: " << prog << " -d <addresses.db> [-f <file>] [address ...]\n\n"
              << "Options:\n"
              << "  -d, --database   Database file\n"
              << "  -f, --file       Read addresses from a file, one per line ('-' for stdin)\n"
              << "  -h, --help       Show this help message\n";
}

int main(int argc, char* argv[]) {
    std::string db_file;
    std::string list_file;

    static struct option long_options[] = {
        {"database", required_argument, nullptr, 'd'},
        {"file",     required_argument, nullptr, 'f'},
        {"help",     no_argument,       nullptr, 'h'},
        {nullptr,    0,                 nullptr, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "d:f:h", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'd': db_file = optarg; break;
            case 'f': list_file = optarg; break;
            case 'h':
                print_usage(argv[0]);
                return 0;
            default:
                print_usage(argv[0]);
                return 2;
        }
    }

    std::vector<std::string> queries(argv + optind, argv + argc);
    if (!list_file.empty()) {
        std::ifstream file;
        std::istream* in = &std::cin;
        if (list_file != "-") {
            file.open(list_file);
            if (!file) {
                std::cerr << "[!] Cannot open " << list_file << "\n";
                return 2;
            }
            in = &file;
        }
        std::string line;
        while (std::getline(*in, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (!line.empty()) queries.push_back(line);
        }
    }

    if (db_file.empty() || queries.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    AddressDatabase db;
    try {
        db = AddressDatabase::load(db_file);
    } catch (const Error& e) {
        std::cerr << "[!] " << e.what() << "\n";
        return 2;
    }
    std::cout << "[*] " << db_file << ": " << db.size() << " entries\n";

    bool all_found = true;
    for (const auto& query : queries) {
        try {
            DecodedAddress decoded = decode_address(query);
            bool found = db.contains(decoded.hash);
            all_found = all_found && found;
            std::cout << (found ? "[+] " : "[-] ") << query << " ("
                      << address_type_name(decoded.type) << ", " << decoded.hash.to_hex() << ")"
                      << (found ? " found\n" : " not found\n");
        } catch (const std::invalid_argument& e) {
            all_found = false;
            std::cout << "[!] " << query << ": " << e.what() << "\n";
        }
    }

    return all_found ? 0 : 1;
}
