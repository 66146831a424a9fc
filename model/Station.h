#pragma once

#include <QString>
#include <QUuid>

namespace RailPrecedence::Model {

struct Station {
    QUuid id;
    QString name;
    QString code;               // Unique station code, e.g. "BCT"
    double latitude = 0.0;
    double longitude = 0.0;
    int platforms = 0;
    bool isJunction = false;
};

} // namespace RailPrecedence::Model
