#include "chorewheel/data/InMemoryRotationStateRepository.hpp"

namespace chorewheel {
namespace data {

InMemoryRotationStateRepository::InMemoryRotationStateRepository() = default;
InMemoryRotationStateRepository::~InMemoryRotationStateRepository() = default;

std::optional<RotationTable> InMemoryRotationStateRepository::load(QString *errorMessage) const
{
    if (!m_table && errorMessage) {
        *errorMessage = QStringLiteral("no rotation state stored");
    }
    return m_table;
}

bool InMemoryRotationStateRepository::save(const RotationTable &table, QString *errorMessage)
{
    if (m_failSaves) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("save rejected");
        }
        return false;
    }
    m_table = table;
    m_lastSaved = QDateTime::currentDateTime();
    ++m_saveCount;
    return true;
}

QDateTime InMemoryRotationStateRepository::lastSaved() const
{
    return m_lastSaved;
}

int InMemoryRotationStateRepository::saveCount() const
{
    return m_saveCount;
}

void InMemoryRotationStateRepository::setFailSaves(bool fail)
{
    m_failSaves = fail;
}

} // namespace data
} // namespace chorewheel
