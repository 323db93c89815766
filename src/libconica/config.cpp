// =====================================================================
//  src/libconica/config.cpp — Resolver configuration I/O
// =====================================================================
//
//  Part of libconica.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <conica/config.h>

#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QtGlobal>

namespace conica {
namespace config {

namespace {

const QString KEY_PASS_COUNT = QStringLiteral("pass_count");
const QString KEY_DETECT = QStringLiteral("detect_non_convergence");
const QString KEY_TOLERANCE = QStringLiteral("convergence_tolerance");

}  // namespace

bool optionsFromJson(const QJsonObject& json, scene::ResolverOptions& options,
                     QString* errorMsg)
{
    scene::ResolverOptions parsed = options;

    if (json.contains(KEY_PASS_COUNT)) {
        const QJsonValue v = json[KEY_PASS_COUNT];
        if (!v.isDouble()) {
            if (errorMsg) *errorMsg = QStringLiteral("\"%1\" must be a number").arg(KEY_PASS_COUNT);
            return false;
        }
        parsed.passCount = qBound(MIN_PASS_COUNT, v.toInt(scene::ResolverOptions().passCount),
                                  MAX_PASS_COUNT);
    }

    if (json.contains(KEY_DETECT)) {
        const QJsonValue v = json[KEY_DETECT];
        if (!v.isBool()) {
            if (errorMsg) *errorMsg = QStringLiteral("\"%1\" must be a boolean").arg(KEY_DETECT);
            return false;
        }
        parsed.detectNonConvergence = v.toBool();
    }

    if (json.contains(KEY_TOLERANCE)) {
        const QJsonValue v = json[KEY_TOLERANCE];
        if (!v.isDouble() || v.toDouble() < 0.0) {
            if (errorMsg) *errorMsg = QStringLiteral("\"%1\" must be a non-negative number").arg(KEY_TOLERANCE);
            return false;
        }
        parsed.convergenceTolerance = v.toDouble();
    }

    options = parsed;
    return true;
}

QJsonObject optionsToJson(const scene::ResolverOptions& options)
{
    QJsonObject obj;
    obj[KEY_PASS_COUNT] = options.passCount;
    obj[KEY_DETECT] = options.detectNonConvergence;
    obj[KEY_TOLERANCE] = options.convergenceTolerance;
    return obj;
}

bool loadOptions(const QString& path, scene::ResolverOptions& options, QString* errorMsg)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        if (errorMsg) *errorMsg = QStringLiteral("Failed to read options: %1").arg(file.errorString());
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (errorMsg) *errorMsg = QStringLiteral("Invalid options JSON: %1").arg(parseError.errorString());
        return false;
    }
    if (!doc.isObject()) {
        if (errorMsg) *errorMsg = QStringLiteral("Invalid options JSON: expected an object");
        return false;
    }

    return optionsFromJson(doc.object(), options, errorMsg);
}

bool saveOptions(const QString& path, const scene::ResolverOptions& options, QString* errorMsg)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        if (errorMsg) *errorMsg = QStringLiteral("Failed to write options: %1").arg(file.errorString());
        return false;
    }

    QJsonDocument doc(optionsToJson(options));
    file.write(doc.toJson(QJsonDocument::Indented));
    return true;
}

}  // namespace config
}  // namespace conica
