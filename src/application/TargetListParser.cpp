#include "application/TargetListParser.hpp"
#include "application/StateSpecParser.hpp"
#include "domain/Errors.hpp"
#include <fstream>
#include <sstream>

namespace variantwalker::application {

std::vector<domain::NodeAddress> TargetListParser::Parse(const std::string& text) {
    std::vector<domain::NodeAddress> targets;
    std::istringstream in(text);
    std::string line;
    int lineNumber = 0;
    while (std::getline(in, line)) {
        ++lineNumber;
        size_t start = line.find_first_not_of(" \t\r");
        if (start == std::string::npos || line[start] == '#') continue;
        try {
            targets.push_back(StateSpecParser::ParseAddress(line));
        } catch (const domain::StructuralError&) {
            throw domain::StructuralError("Invalid target line " + std::to_string(lineNumber) +
                                          " (expected seq:msg): " + line);
        }
    }
    return targets;
}

std::vector<domain::NodeAddress> TargetListParser::ParseFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw domain::StructuralError("Cannot open target list: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return Parse(buffer.str());
}

} // namespace variantwalker::application
