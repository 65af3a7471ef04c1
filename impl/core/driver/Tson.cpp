#include <iostream>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "../shared/Components.h"
#include "Profile.h"

//#define DEBUG

int main(int argc, char* argv[]) {
    std::vector<std::string> argVector(argv, argv + argc);
    auto printInfo = [](std::ostream& stream) {
        stream << "tson: A Typed JSON Parsing Utility\n";
        stream << "Built at: " __TIME__ " " __DATE__ << "\n";
        stream.flush();
    };
    auto printHelp = [&argVector](std::ostream& stream) {
        stream << "Usage:\n"
            << argVector[0] << " --check <path>\n"
            << "    Check the JSON file <path> for correctness.\n"
            << argVector[0] << " --dump <path> [--indent <n>]\n"
            << "    Parse the JSON file <path> and print it back, sorted by key.\n"
            << argVector[0] << " --profile <path>\n"
            << "    Read the JSON file <path> into the sample profile records and print a summary.\n"
            << argVector[0] << " --help\n"
            << argVector[0] << " -h\n"
            << "    Print this help message.\n";
    };
    auto printInvalidArguments = [&argVector, &printInfo, &printHelp]() {
        printInfo(std::cerr);
        std::cerr << "invalid arguments:";
        for (const auto& arg : argVector) {
            std::cerr << " " << arg;
        }
        std::cerr << "\n";
        printHelp(std::cerr);
    };
    auto readDiskFile = [](const std::string& path) -> std::optional<std::string> {
        if (!std::filesystem::is_regular_file(path)) {
            return std::nullopt;
        }
        std::ifstream file(path, std::ios::in | std::ios::binary);
        if (!file.is_open()) {
            return std::nullopt;
        }
        std::ostringstream content;
        content << file.rdbuf();
        return content.str();
    };
    auto reportError = [](const std::string& inputPath, const TSON::ParserErr& error) {
        std::cerr << "\nErrors in " << inputPath << ":\n";
        std::cerr << "error: " << error.toString() << "\n";
    };

    if (argc == 3 && argVector[1] == "--check") {
        const auto inputPath = argVector[2];
        auto source = readDiskFile(inputPath);
        if (!source) {
            printInfo(std::cerr);
            std::cerr << "file " << inputPath << " is not valid\n";
            return 1;
        }
#ifndef DEBUG
        try {
#endif // DEBUG
            auto result = TSON::parse<TSON::JsonValue>(*source);
            if (!result) {
                reportError(inputPath, result.error());
                return 1;
            }
            std::cout << "valid\n";
#ifndef DEBUG
        }
        catch (const std::exception& e) {
            std::cerr << e.what() << '\n';
            return 1;
        }
#endif // DEBUG
    }
    else if ((argc == 3 || argc == 5) && argVector[1] == "--dump") {
        const auto inputPath = argVector[2];
        int indent = -1;
        if (argc == 5) {
            if (argVector[3] != "--indent") {
                printInvalidArguments();
                return 2;
            }
            try {
                indent = std::stoi(argVector[4]);
            }
            catch (const std::exception&) {
                printInvalidArguments();
                return 2;
            }
        }
        auto source = readDiskFile(inputPath);
        if (!source) {
            printInfo(std::cerr);
            std::cerr << "file " << inputPath << " is not valid\n";
            return 1;
        }
#ifndef DEBUG
        try {
#endif // DEBUG
            auto result = TSON::parse<TSON::JsonValue>(*source);
            if (!result) {
                reportError(inputPath, result.error());
                return 1;
            }
            std::cout << TSON::dump(*result, indent) << "\n";
#ifndef DEBUG
        }
        catch (const std::exception& e) {
            std::cerr << e.what() << '\n';
            return 1;
        }
#endif // DEBUG
    }
    else if (argc == 3 && argVector[1] == "--profile") {
        const auto inputPath = argVector[2];
        auto source = readDiskFile(inputPath);
        if (!source) {
            printInfo(std::cerr);
            std::cerr << "file " << inputPath << " is not valid\n";
            return 1;
        }
#ifndef DEBUG
        try {
#endif // DEBUG
            auto result = TSON::parse<Profile::Root>(*source);
            if (!result) {
                reportError(inputPath, result.error());
                return 1;
            }
            const auto& root = *result;
            printInfo(std::cout);
            std::cout << "name: " << root.name << "\n"
                << "age: " << root.age << "\n"
                << "verified: " << (root.isVerified ? "yes" : "no") << "\n"
                << "balance: " << root.balance << "\n"
                << "nickname: " << root.nickname.value_or("(none)") << "\n"
                << "email: " << root.contact.email << "\n"
                << "city: " << root.contact.address.city << ", " << root.contact.address.country << "\n"
                << "theme: " << root.preferences.theme << " (" << root.preferences.language << ")\n"
                << "notifications: email=" << root.preferences.notifications.email
                << " sms=" << root.preferences.notifications.sms << "\n"
                << "tags: " << root.tags.size() << "\n"
                << "logins: " << root.history.size() << "\n"
                << "unicode: " << root.unicodeExample << "\n"
                << "numbers: int=" << root.numbers.intValue
                << " float=" << root.numbers.floatValue
                << " scientific=" << root.numbers.scientific
                << " negative=" << root.numbers.negative << "\n";
#ifndef DEBUG
        }
        catch (const std::exception& e) {
            std::cerr << e.what() << '\n';
            return 1;
        }
#endif // DEBUG
    }
    else if (argc == 2 && (argVector[1] == "--help" || argVector[1] == "-h")) {
        printInfo(std::cout);
        printHelp(std::cout);
    }
    else {
        printInvalidArguments();
        return 2;
    }
    return 0;
}
