/*
* PopState
 * Copyright (C) 2025 Swift Storm Studio
 *
 * This file is part of PopState.
 *
 * PopState is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * PopState is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with PopState.  If not, see <https://www.gnu.org/licenses/>.
 */

// tools/popstate_tool.cpp
/*
 * PopState command line tool
 *
 * Run:
 *   ./popstate-tool info <file>
 *   ./popstate-tool header <file>
 *   ./popstate-tool census <file>
 *   ./popstate-tool recompress <in> <out> --compression NONE|LZ4|SNAPPY
 */

#include "popstate/PopState.hpp"

#include <cstring>
#include <iomanip>
#include <iostream>
#include <string>

using namespace popstate;

namespace {
    void print_separator(size_t length = 70) { std::cout << std::string(length, '=') << std::endl; }

    void print_dash(size_t length = 70) { std::cout << std::string(length, '-') << std::endl; }

    void print_usage() {
        std::cerr << "Usage:" << std::endl;
        std::cerr << "  popstate-tool info <file>" << std::endl;
        std::cerr << "  popstate-tool header <file>" << std::endl;
        std::cerr << "  popstate-tool census <file>" << std::endl;
        std::cerr << "  popstate-tool recompress <in> <out> --compression NONE|LZ4|SNAPPY" << std::endl;
    }

    void print_legacy_info(Container& c) {
        auto& layout = c.legacy();
        const auto sizes = layout.chunk_sizes();

        std::cout << "Compression:    " << core::codec::legacy_name(layout.compression()) << std::endl;
        std::cout << "Chunks:         " << layout.chunk_count() << std::endl;
        std::cout << "Byte count:     " << layout.byte_count() << std::endl;
        for (size_t i = 0; i < sizes.size(); ++i) {
            std::cout << "  [" << std::setw(4) << i << "] " << sizes[i] << " bytes" << std::endl;
        }
        std::cout << "Nodes:          " << layout.node_count() << std::endl;
    }

    void print_chunked_info(Container& c) {
        const auto& table = c.header().chunked();

        uint64_t records = 0;
        uint64_t human_bytes = 0;
        for (const auto& h : table.humans) {
            records += h.record_count;
            human_bytes += h.size;
        }

        std::cout << "Simulation:     " << table.simulation.size << " bytes ("
                  << core::codec::v6_code(table.simulation.compression) << ")" << std::endl;
        std::cout << "Node chunks:    " << table.nodes.size() << std::endl;
        for (const auto& n : table.nodes) {
            std::cout << "  suid " << std::setw(8) << n.suid << "  " << n.size << " bytes ("
                      << core::codec::v6_code(n.compression) << ")" << std::endl;
        }
        std::cout << "Human chunks:   " << table.humans.size() << " (" << human_bytes << " bytes)" << std::endl;
        std::cout << "Records:        " << records << std::endl;

        const size_t orphans = c.chunked().orphan_collection_count();
        if (orphans > 0) { std::cout << "Orphan chunks:  " << orphans << std::endl; }
    }

    int run_info(const std::string& path) {
        auto c = popstate::read(path);

        print_separator();
        std::cout << "File:           " << path << std::endl;
        std::cout << "Version:        " << c.version() << std::endl;
        std::cout << "Author:         " << c.author() << std::endl;
        std::cout << "Tool:           " << c.tool() << std::endl;
        std::cout << "Date:           " << c.date() << std::endl;
        print_dash();

        if (c.is_chunked()) { print_chunked_info(c); }
        else { print_legacy_info(c); }

        print_separator();
        return 0;
    }

    int run_header(const std::string& path) {
        auto reader = PopulationReader::open(path);
        std::cout << Json::parse(reader->read_header().serialize()).dump(4) << std::endl;
        return 0;
    }

    int run_census(const std::string& path) {
        auto c = popstate::read(path);

        uint64_t total = 0;
        auto nodes = c.nodes();
        for (auto it = nodes.begin(); it != nodes.end(); ++it) {
            const size_t count = it->individual_humans().size();
            std::cout << "node " << std::setw(6) << it.index();
            if (const auto suid = it->suid()) { std::cout << "  suid " << std::setw(8) << *suid; }
            std::cout << "  records " << count << std::endl;
            total += count;
        }

        print_dash();
        std::cout << "Total records: " << total << std::endl;
        return 0;
    }

    int run_recompress(const std::string& in, const std::string& out, const std::string& scheme_name) {
        const Compression scheme = core::codec::parse_legacy_name(scheme_name);

        auto c = popstate::read(in);
        if (c.is_chunked()) { c.chunked().recompress_all(scheme); }
        else { c.legacy().set_compression(scheme); }

        std::cout << "Writing file: " << out << std::endl;
        popstate::write(c, out);
        return 0;
    }
} // anonymous namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        print_usage();
        return 1;
    }

    const std::string command = argv[1];

    try {
        if (command == "info") { return run_info(argv[2]); }
        if (command == "header") { return run_header(argv[2]); }
        if (command == "census") { return run_census(argv[2]); }
        if (command == "recompress") {
            std::string scheme = "LZ4";
            for (int i = 4; i < argc; ++i) {
                if (std::strcmp(argv[i], "--compression") == 0 && i + 1 < argc) {
                    scheme = argv[i + 1];
                    break;
                }
            }
            if (argc < 4) {
                print_usage();
                return 1;
            }
            return run_recompress(argv[2], argv[3], scheme);
        }

        std::cerr << "Unknown command: " << command << std::endl;
        print_usage();
        return 1;
    }
    catch (const PopStateError& e) {
        std::cerr << "Error [" << core::to_string(e.code()) << "]: " << e.what() << std::endl;
        return 2;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
