#include "core/dxf_reader.h"
#include <cstdlib>
#include <fstream>

namespace aidcis {
namespace plate {

namespace {

// Entity currently being assembled from group codes
struct PendingEntity {
    bool active = false;
    CadPrimitive primitive;
    bool hasCenterX = false;
    bool hasCenterY = false;
    bool hasRadius = false;
    bool hasStartAngle = false;
    bool hasEndAngle = false;

    bool complete() const {
        bool located = hasCenterX && hasCenterY && hasRadius;
        if (primitive.kind == PrimitiveKind::ARC) {
            return located && hasStartAngle && hasEndAngle;
        }
        return located;
    }
};

bool parseDouble(const std::string& text, double& value) {
    char* end = nullptr;
    value = std::strtod(text.c_str(), &end);
    return end != text.c_str() && *end == '\0';
}

} // anonymous namespace

void DxfReader::clear() {
    m_primitives.clear();
    m_ignored.clear();
    m_lastError.clear();
}

bool DxfReader::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        clear();
        m_lastError = "Could not open DXF file: " + filename;
        return false;
    }
    return parse(file);
}

std::string DxfReader::trim(const std::string& str) {
    const std::string whitespace = " \t\r\n";
    size_t first = str.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(whitespace);
    return str.substr(first, last - first + 1);
}

bool DxfReader::readPair(std::istream& input, int& code, std::string& value) {
    std::string codeLine;
    std::string valueLine;
    if (!std::getline(input, codeLine) || !std::getline(input, valueLine)) {
        return false;
    }

    codeLine = trim(codeLine);
    char* end = nullptr;
    long parsed = std::strtol(codeLine.c_str(), &end, 10);
    if (codeLine.empty() || *end != '\0') {
        return false;
    }

    code = static_cast<int>(parsed);
    value = trim(valueLine);
    return true;
}

bool DxfReader::parse(std::istream& input) {
    clear();

    if (!input.good()) {
        m_lastError = "DXF stream is not readable";
        return false;
    }

    bool inSection = false;
    bool expectSectionName = false;
    bool inEntities = false;
    bool sawEntities = false;
    PendingEntity pending;
    size_t pairNumber = 0;

    auto flush = [this, &pending]() {
        if (pending.active) {
            if (pending.complete()) {
                m_primitives.push_back(pending.primitive);
            } else {
                m_ignored["INCOMPLETE"]++;
            }
        }
        pending = PendingEntity();
    };

    bool malformed = false;
    int code = 0;
    std::string value;
    while (true) {
        if (!readPair(input, code, value)) {
            // Running out of lines ends the drawing, anything else is corrupt
            malformed = !input.eof();
            break;
        }
        pairNumber++;

        if (code == 0) {
            flush();

            if (value == "SECTION") {
                inSection = true;
                expectSectionName = true;
            } else if (value == "ENDSEC") {
                inSection = false;
                inEntities = false;
            } else if (value == "EOF") {
                break;
            } else if (inEntities) {
                if (value == "CIRCLE" || value == "ARC") {
                    pending.active = true;
                    pending.primitive.kind = value == "CIRCLE" ? PrimitiveKind::CIRCLE
                                                               : PrimitiveKind::ARC;
                } else {
                    m_ignored[value]++;
                }
            }
            continue;
        }

        if (code == 2 && expectSectionName) {
            expectSectionName = false;
            inEntities = inSection && value == "ENTITIES";
            sawEntities = sawEntities || inEntities;
            continue;
        }

        if (!pending.active) {
            continue;
        }

        double number = 0.0;
        switch (code) {
            case 8:
                pending.primitive.layer = value;
                break;
            case 10:
                pending.hasCenterX = parseDouble(value, number);
                pending.primitive.centerX = number;
                break;
            case 20:
                pending.hasCenterY = parseDouble(value, number);
                pending.primitive.centerY = number;
                break;
            case 40:
                pending.hasRadius = parseDouble(value, number) && number > 0.0;
                pending.primitive.radius = number;
                break;
            case 50:
                pending.hasStartAngle = parseDouble(value, number);
                pending.primitive.startAngle = number;
                break;
            case 51:
                pending.hasEndAngle = parseDouble(value, number);
                pending.primitive.endAngle = number;
                break;
            default:
                break;
        }
    }
    flush();

    if (malformed) {
        m_lastError = "Malformed group code near pair " + std::to_string(pairNumber + 1);
        return false;
    }

    if (!sawEntities) {
        m_lastError = "DXF content has no ENTITIES section";
        return false;
    }

    return true;
}

std::map<std::string, int> DxfReader::getLayerCounts() const {
    std::map<std::string, int> counts;
    for (const auto& primitive : m_primitives) {
        counts[primitive.layer]++;
    }
    return counts;
}

} // namespace plate
} // namespace aidcis
