#pragma once

#include "chorewheel/data/RotationStateRepository.hpp"

namespace chorewheel {
namespace data {

class InMemoryRotationStateRepository : public RotationStateRepository
{
public:
    InMemoryRotationStateRepository();
    ~InMemoryRotationStateRepository() override;

    std::optional<RotationTable> load(QString *errorMessage = nullptr) const override;
    bool save(const RotationTable &table, QString *errorMessage = nullptr) override;
    QDateTime lastSaved() const override;

    int saveCount() const;
    void setFailSaves(bool fail);

private:
    std::optional<RotationTable> m_table;
    QDateTime m_lastSaved;
    int m_saveCount = 0;
    bool m_failSaves = false;
};

} // namespace data
} // namespace chorewheel
