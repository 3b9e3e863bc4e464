#pragma once

#include <QDateTime>
#include <QString>
#include <optional>

#include "chorewheel/data/RotationDefinition.hpp"

namespace chorewheel {
namespace data {

class RotationStateRepository
{
public:
    virtual ~RotationStateRepository() = default;

    // std::nullopt when no state exists or it cannot be parsed.
    virtual std::optional<RotationTable> load(QString *errorMessage = nullptr) const = 0;
    // Leaves the previous state untouched on failure.
    virtual bool save(const RotationTable &table, QString *errorMessage = nullptr) = 0;
    // Invalid when nothing has been stored yet.
    virtual QDateTime lastSaved() const = 0;
};

} // namespace data
} // namespace chorewheel
