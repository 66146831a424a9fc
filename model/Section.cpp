#include "Section.h"
#include "Train.h"

namespace RailPrecedence::Model {

QString sectionStatusToString(SectionStatus status) {
    switch (status) {
        case SectionStatus::AVAILABLE:   return "available";
        case SectionStatus::OCCUPIED:    return "occupied";
        case SectionStatus::MAINTENANCE: return "maintenance";
        case SectionStatus::BLOCKED:     return "blocked";
    }
    return "available";
}

std::optional<SectionStatus> sectionStatusFromString(const QString& value) {
    const QString normalized = value.trimmed().toLower();
    if (normalized == "available")   return SectionStatus::AVAILABLE;
    if (normalized == "occupied")    return SectionStatus::OCCUPIED;
    if (normalized == "maintenance") return SectionStatus::MAINTENANCE;
    if (normalized == "blocked")     return SectionStatus::BLOCKED;
    return std::nullopt;
}

bool Section::isAvailable() const {
    return status == SectionStatus::AVAILABLE && occupantCount() < tracks;
}

bool Section::canAccommodate(const Train& train) const {
    return isAvailable() && train.maxSpeed() <= maxSpeedKmh;
}

} // namespace RailPrecedence::Model
