#pragma once

#include "chorewheel/data/RotationStateRepository.hpp"

namespace chorewheel {
namespace data {

// CSV rows of (rotation key, anchor date, 1-based position, name, rotating).
class FileRotationStateRepository : public RotationStateRepository
{
public:
    explicit FileRotationStateRepository(QString filePath);
    ~FileRotationStateRepository() override = default;

    std::optional<RotationTable> load(QString *errorMessage = nullptr) const override;
    bool save(const RotationTable &table, QString *errorMessage = nullptr) override;
    QDateTime lastSaved() const override;

    const QString &filePath() const;

private:
    QString m_filePath;
};

} // namespace data
} // namespace chorewheel
