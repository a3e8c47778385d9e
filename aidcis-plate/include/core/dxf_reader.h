#ifndef AIDCIS_PLATE_DXF_READER_H
#define AIDCIS_PLATE_DXF_READER_H

#include "core/geometry_extractor.h"
#include <istream>
#include <map>
#include <string>
#include <vector>

namespace aidcis {
namespace plate {

/**
 * Reads CIRCLE and ARC entities from an ASCII DXF drawing.
 *
 * Only the ENTITIES section is interpreted. Other entity types are counted
 * and skipped. A CIRCLE needs 10/20/40 and an ARC also needs 50/51; entities
 * missing any of them are counted as INCOMPLETE. Coordinates are taken as
 * world coordinates: the OCS extrusion (210/220/230) is not applied.
 */
class DxfReader {
public:
    DxfReader() = default;

    // Parse a DXF file from disk
    bool loadFromFile(const std::string& filename);

    // Parse DXF content from any stream
    bool parse(std::istream& input);

    const std::vector<CadPrimitive>& getPrimitives() const { return m_primitives; }
    const std::string& getLastError() const { return m_lastError; }

    // Entities other than CIRCLE/ARC, by type name
    const std::map<std::string, int>& getIgnoredEntities() const { return m_ignored; }

    // Primitive counts per layer
    std::map<std::string, int> getLayerCounts() const;

    void clear();

private:
    std::vector<CadPrimitive> m_primitives;
    std::map<std::string, int> m_ignored;
    std::string m_lastError;

    static bool readPair(std::istream& input, int& code, std::string& value);
    static std::string trim(const std::string& str);
};

} // namespace plate
} // namespace aidcis

#endif // AIDCIS_PLATE_DXF_READER_H
