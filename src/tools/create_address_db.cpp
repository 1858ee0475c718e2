/**
 * Address Database Builder CLI
 *
 * Builds a seedhound address database from address lists (one address per
 * line, optionally followed by other CSV columns such as a balance).
 *
 * Usage:
 *   seedhound-create-db -o addresses.db list1.txt [list2.csv ...]
 *
 * Options:
 *   -o, --output     Output database file
 *   -a, --append     Merge into an existing database
 *   -s, --stats      Show per-file statistics
 *   -h, --help       Show this help message
 */

#include "../core/address_db.hpp"
#include "../core/errors.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <getopt.h>

using namespace seedhound;

void print_usage(const char* prog) {
    std::cout << "Address Database Builder\n"
              << "Usage: " << prog << " -o <output.db> <input> [input ...]\n\n"
              << "Options:\n"
              << "  -o, --output     Output database file\n"
              << "  -a, --append     Merge into the existing output database\n"
              << "  -s, --stats      Show per-file statistics\n"
              << "  -h, --help       Show this help message\n\n"
              << "Input lines hold an address (1..., 3..., bc1q...) or a 40 character\n"
              << "hash160, optionally followed by ',' and other columns. '-' reads stdin.\n\n"
              << "Example:\n"
              << "  " << prog << " -o addresses.db funded.csv\n";
}

int main(int argc, char* argv[]) {
    std::string output_file;
    bool append = false;
    bool show_stats = false;

    static struct option long_options[] = {
        {"output", required_argument, nullptr, 'o'},
        {"append", no_argument,       nullptr, 'a'},
        {"stats",  no_argument,       nullptr, 's'},
        {"help",   no_argument,       nullptr, 'h'},
        {nullptr,  0,                 nullptr, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "o:ash", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'o': output_file = optarg; break;
            case 'a': append = true; break;
            case 's': show_stats = true; break;
            case 'h':
                print_usage(argv[0]);
                return 0;
            default:
                print_usage(argv[0]);
                return 2;
        }
    }

    if (output_file.empty() || optind >= argc) {
        std::cerr << "[!] Output file and at least one input are required\n\n";
        print_usage(argv[0]);
        return 2;
    }

    auto start = std::chrono::steady_clock::now();

    try {
        AddressDatabase db;
        if (append) {
            db = AddressDatabase::load(output_file);
            std::cout << "[*] Appending to " << output_file << " (" << db.size() << " entries)\n";
        }

        AddressDatabase::ImportStats total;
        for (int i = optind; i < argc; i++) {
            std::string input = argv[i];
            AddressDatabase::ImportStats stats;
            if (input == "-") {
                stats = db.import(std::cin);
            } else {
                std::ifstream in(input);
                if (!in) {
                    std::cerr << "[!] Cannot open " << input << "\n";
                    return 2;
                }
                stats = db.import(in);
            }
            if (show_stats) {
                std::cout << "[*] " << input << ": " << stats.lines << " lines, "
                          << stats.added << " added, " << stats.skipped << " skipped\n";
            }
            total.lines += stats.lines;
            total.added += stats.added;
            total.skipped += stats.skipped;
        }

        db.finalize();
        db.save(output_file);

        auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        std::cout << "[+] Wrote " << output_file << ": " << db.size() << " unique entries ("
                  << total.skipped << " lines skipped) in " << elapsed << "s\n";
    } catch (const Error& e) {
        std::cerr << "[!] " << e.what() << "\n";
        return 2;
    }

    return 0;
}
