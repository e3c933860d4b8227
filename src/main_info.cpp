#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>

#include "hackrf_one.hpp"


int main(int argc, char** argv) {
    const char* serial = nullptr;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-d" && i + 1 < argc) {
            serial = argv[++i];
        } else {
            std::cerr << "Usage: " << argv[0] << " [-d ser_nr]\n";
            return 1;
        }
    }

    std::string error;
    std::unique_ptr<HackrfOne> device = HackrfOne::open(serial, &error);
    if (!device) {
        std::fprintf(stderr, "open failed: %s\n", error.c_str());
        return EXIT_FAILURE;
    }

    std::cout << "Found " << device->get_device_info() << "\n";

    uint8_t board_id = BOARD_ID_UNDETECTED;
    Status result = device->board_id_read(&board_id);
    if (result != Status::Success) {
        std::fprintf(stderr, "board_id_read() failed: %s (%s)\n", device->get_last_error().c_str(), status_name(result));
        return EXIT_FAILURE;
    }
    std::printf("Board ID Number: %d (%s)\n", board_id, board_id_name(board_id));

    std::string version;
    result = device->version_string_read(&version);
    if (result != Status::Success) {
        std::fprintf(stderr, "version_string_read() failed: %s (%s)\n", device->get_last_error().c_str(), status_name(result));
        return EXIT_FAILURE;
    }
    std::printf("Firmware Version: %s (API:%s)\n", version.c_str(), device->usb_api_version().to_string().c_str());

    PartIdSerialNo serno;
    result = device->board_partid_serialno_read(&serno);
    if (result != Status::Success) {
        std::fprintf(stderr, "board_partid_serialno_read() failed: %s (%s)\n", device->get_last_error().c_str(), status_name(result));
        return EXIT_FAILURE;
    }
    std::printf("Part ID Number: 0x%08x 0x%08x\n", serno.part_id[0], serno.part_id[1]);
    std::printf("Serial Number: 0x%08x 0x%08x 0x%08x 0x%08x\n",
        serno.serial_no[0], serno.serial_no[1], serno.serial_no[2], serno.serial_no[3]);

    return 0;
}
