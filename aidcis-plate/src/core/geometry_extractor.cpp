#include "core/geometry_extractor.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <map>
#include <sstream>
#include <utility>

namespace aidcis {
namespace plate {

namespace {

// Spatial hash cell used to group primitives by center
typedef std::pair<long long, long long> CellKey;

CellKey cellFor(double x, double y, double cellSize) {
    return CellKey(static_cast<long long>(std::floor(x / cellSize)),
                   static_cast<long long>(std::floor(y / cellSize)));
}

std::string provisionalId(size_t ordinal) {
    std::ostringstream oss;
    oss << "H" << std::setw(5) << std::setfill('0') << ordinal;
    return oss.str();
}

std::string formatIndices(const std::vector<size_t>& indices) {
    std::ostringstream oss;
    for (size_t i = 0; i < indices.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << "#" << indices[i];
    }
    return oss.str();
}

} // anonymous namespace

CadPrimitive CadPrimitive::circle(double cx, double cy, double r, const std::string& layer) {
    CadPrimitive primitive;
    primitive.kind = PrimitiveKind::CIRCLE;
    primitive.centerX = cx;
    primitive.centerY = cy;
    primitive.radius = r;
    primitive.layer = layer;
    return primitive;
}

CadPrimitive CadPrimitive::arc(double cx, double cy, double r, double startDeg, double endDeg,
                               const std::string& layer) {
    CadPrimitive primitive;
    primitive.kind = PrimitiveKind::ARC;
    primitive.centerX = cx;
    primitive.centerY = cy;
    primitive.radius = r;
    primitive.startAngle = startDeg;
    primitive.endAngle = endDeg;
    primitive.layer = layer;
    return primitive;
}

std::string skipReasonToString(SkipReason reason) {
    switch (reason) {
        case SkipReason::UNMATCHED_ARC:       return "unmatched arc";
        case SkipReason::INCOMPLETE_COVERAGE: return "incomplete coverage";
        case SkipReason::AMBIGUOUS_DUPLICATE: return "ambiguous duplicate";
        case SkipReason::RADIUS_MISMATCH:     return "radius mismatch";
    }
    return "unknown";
}

bool ExtractionResult::getBoundaryCircle(RejectedCircle& circle) const {
    if (rejectedCircles.empty()) {
        return false;
    }

    circle = *std::max_element(rejectedCircles.begin(), rejectedCircles.end(),
        [](const RejectedCircle& a, const RejectedCircle& b) { return a.radius < b.radius; });
    return true;
}

GeometryExtractor::GeometryExtractor(const ExtractionParams& params)
    : m_params(params) {}

double GeometryExtractor::uncoveredDegrees(const std::vector<const CadPrimitive*>& members) {
    std::vector<std::pair<double, double>> intervals;

    for (const CadPrimitive* primitive : members) {
        if (primitive->kind == PrimitiveKind::CIRCLE) {
            return 0.0;
        }

        double start = angles::normalizeDegrees(primitive->startAngle);
        double span = angles::sweep(primitive->startAngle, primitive->endAngle);
        double end = start + span;

        if (end > 360.0) {
            intervals.push_back(std::make_pair(start, 360.0));
            intervals.push_back(std::make_pair(0.0, end - 360.0));
        } else {
            intervals.push_back(std::make_pair(start, end));
        }
    }

    if (intervals.empty()) {
        return 360.0;
    }

    std::sort(intervals.begin(), intervals.end());

    // Union length of the sorted intervals
    double covered = 0.0;
    double currentStart = intervals[0].first;
    double currentEnd = intervals[0].second;

    for (size_t i = 1; i < intervals.size(); ++i) {
        if (intervals[i].first <= currentEnd) {
            currentEnd = std::max(currentEnd, intervals[i].second);
        } else {
            covered += currentEnd - currentStart;
            currentStart = intervals[i].first;
            currentEnd = intervals[i].second;
        }
    }
    covered += currentEnd - currentStart;

    return std::max(0.0, 360.0 - covered);
}

bool GeometryExtractor::sameFeature(const CadPrimitive& a, const CadPrimitive& b) const {
    double dx = a.centerX - b.centerX;
    double dy = a.centerY - b.centerY;
    return std::sqrt(dx * dx + dy * dy) <= m_params.positionTolerance &&
           std::fabs(a.radius - b.radius) <= m_params.radiusTolerance;
}

std::vector<std::vector<size_t>> GeometryExtractor::groupPrimitives(
    const std::vector<CadPrimitive>& primitives) const {

    std::vector<std::vector<size_t>> groups;
    std::map<CellKey, std::vector<size_t>> cells;   // cell -> group indices
    const double cellSize = m_params.positionTolerance > 0.0 ? m_params.positionTolerance : 1e-6;

    for (size_t i = 0; i < primitives.size(); ++i) {
        const CadPrimitive& primitive = primitives[i];
        CellKey home = cellFor(primitive.centerX, primitive.centerY, cellSize);

        // The first group (in input order) whose reference member matches wins
        size_t match = groups.size();
        for (long long dx = -1; dx <= 1; ++dx) {
            for (long long dy = -1; dy <= 1; ++dy) {
                auto it = cells.find(CellKey(home.first + dx, home.second + dy));
                if (it == cells.end()) {
                    continue;
                }
                for (size_t groupIndex : it->second) {
                    if (groupIndex < match &&
                        sameFeature(primitives[groups[groupIndex].front()], primitive)) {
                        match = groupIndex;
                    }
                }
            }
        }

        if (match == groups.size()) {
            groups.push_back(std::vector<size_t>(1, i));
            cells[home].push_back(match);
        } else {
            groups[match].push_back(i);
        }
    }

    return groups;
}

ExtractionResult GeometryExtractor::extract(const std::vector<CadPrimitive>& primitives) const {
    ExtractionResult result;
    result.primitiveCount = primitives.size();

    for (const auto& primitive : primitives) {
        if (primitive.kind == PrimitiveKind::CIRCLE) {
            result.circleCount++;
        } else {
            result.arcCount++;
        }
    }

    if (primitives.empty()) {
        addWarning(result, "No primitives to extract holes from");
        result.success = true;
        return result;
    }

    auto members = [&primitives](const std::vector<size_t>& indices) {
        std::vector<const CadPrimitive*> pointers;
        for (size_t index : indices) {
            pointers.push_back(&primitives[index]);
        }
        return pointers;
    };

    auto skip = [&result](size_t index, SkipReason reason, const std::string& message) {
        SkippedPrimitive entry;
        entry.index = index;
        entry.reason = reason;
        entry.message = message;
        result.skipped.push_back(entry);
    };

    size_t holeOrdinal = 0;

    auto mean = [&primitives](const std::vector<size_t>& indices,
                              double& cx, double& cy, double& radius) {
        double sumX = 0.0, sumY = 0.0, sumR = 0.0;
        for (size_t index : indices) {
            sumX += primitives[index].centerX;
            sumY += primitives[index].centerY;
            sumR += primitives[index].radius;
        }
        double count = static_cast<double>(indices.size());
        cx = sumX / count;
        cy = sumY / count;
        radius = sumR / count;
    };

    auto isHoleRadius = [this](double radius) {
        return std::fabs(radius - m_params.expectedHoleRadius) <= m_params.radiusTolerance;
    };

    // Off-radius group: one rejected circle when it closes, otherwise just skipped
    auto reject = [&](const std::vector<size_t>& indices) {
        double cx, cy, radius;
        mean(indices, cx, cy, radius);

        std::ostringstream oss;
        oss << "Radius " << radius << " differs from expected "
            << m_params.expectedHoleRadius;

        double gap = uncoveredDegrees(members(indices));
        if (gap <= m_params.gapToleranceDegrees) {
            RejectedCircle rejected;
            rejected.centerX = cx;
            rejected.centerY = cy;
            rejected.radius = radius;
            result.rejectedCircles.push_back(rejected);
        } else {
            oss << ", " << gap << " degrees uncovered";
        }

        for (size_t index : indices) {
            skip(index, SkipReason::RADIUS_MISMATCH, oss.str());
        }
    };

    // Turns a closed set of hole-radius primitives into a hole
    auto accept = [&](const std::vector<size_t>& indices) {
        double cx, cy, radius;
        mean(indices, cx, cy, radius);
        if (!isHoleRadius(radius)) {
            reject(indices);
            return;
        }

        Hole hole(provisionalId(++holeOrdinal), cx, cy, radius);
        hole.setLayer(primitives[indices.front()].layer);
        result.holes.addHole(hole);

        if (indices.size() == 2) {
            result.mergedArcPairs++;
        }
    };

    bool ambiguous = false;

    for (const auto& group : groupPrimitives(primitives)) {
        // Radius decides first; only hole-radius groups can be ambiguous
        double groupX, groupY, groupRadius;
        mean(group, groupX, groupY, groupRadius);
        if (!isHoleRadius(groupRadius)) {
            reject(group);
            continue;
        }

        if (group.size() == 1) {
            size_t index = group.front();
            if (uncoveredDegrees(members(group)) <= m_params.gapToleranceDegrees) {
                accept(group);
            } else {
                skip(index, SkipReason::UNMATCHED_ARC, "Arc has no partner to close the circle");
            }
            continue;
        }

        if (group.size() == 2) {
            double gap = uncoveredDegrees(members(group));
            if (gap <= m_params.gapToleranceDegrees) {
                accept(group);
            } else {
                std::ostringstream oss;
                oss << "Arcs leave " << gap << " degrees uncovered";
                for (size_t index : group) {
                    skip(index, SkipReason::INCOMPLETE_COVERAGE, oss.str());
                }
            }
            continue;
        }

        // Three or more candidates: every single primitive and every pair competes
        ambiguous = true;
        std::vector<size_t> best;
        double bestGap = 361.0;

        for (size_t a = 0; a < group.size(); ++a) {
            std::vector<size_t> single(1, group[a]);
            double gap = uncoveredDegrees(members(single));
            if (gap < bestGap) {
                bestGap = gap;
                best = single;
            }
        }
        for (size_t a = 0; a < group.size(); ++a) {
            for (size_t b = a + 1; b < group.size(); ++b) {
                std::vector<size_t> pair;
                pair.push_back(group[a]);
                pair.push_back(group[b]);
                double gap = uncoveredDegrees(members(pair));
                if (gap < bestGap) {
                    bestGap = gap;
                    best = pair;
                }
            }
        }

        std::ostringstream oss;
        oss << group.size() << " primitives (" << formatIndices(group)
            << ") compete for the hole at (" << primitives[group.front()].centerX
            << ", " << primitives[group.front()].centerY << ")";
        addError(result, oss.str());

        if (bestGap <= m_params.gapToleranceDegrees) {
            accept(best);
            for (size_t index : group) {
                if (std::find(best.begin(), best.end(), index) == best.end()) {
                    skip(index, SkipReason::AMBIGUOUS_DUPLICATE,
                         "Superseded by " + formatIndices(best));
                }
            }
        } else {
            for (size_t index : group) {
                skip(index, SkipReason::INCOMPLETE_COVERAGE,
                     "No combination closes the circle");
            }
        }
    }

    if (ambiguous) {
        result.errorCode = GeometryErrorCode::AMBIGUOUS_MATCH;
    }

    if (result.holes.empty()) {
        result.errorCode = GeometryErrorCode::EMPTY_RESULT;
        addError(result, "No holes reconstructed from " + std::to_string(primitives.size()) +
                 " primitives; check tolerances and expected radius");
    }

    if (!result.skipped.empty()) {
        addWarning(result, std::to_string(result.skipped.size()) + " primitives skipped");
    }

    result.success = result.errorCode == GeometryErrorCode::NONE;
    return result;
}

void GeometryExtractor::addError(ExtractionResult& result, const std::string& error) {
    result.errors.push_back(error);
}

void GeometryExtractor::addWarning(ExtractionResult& result, const std::string& warning) {
    result.warnings.push_back(warning);
}

} // namespace plate
} // namespace aidcis
