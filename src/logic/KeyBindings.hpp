#pragma once

#include <QKeySequence>
#include <QList>
#include <QString>

#include <map>

class QSettings;

/**
 * Maps action names to the key sequences triggering them. Built once at start-up
 * and handed to whoever dispatches input, never modified afterwards.
 */
class KeyBindings
{
public:
    static const char* const ToggleFullscreen;
    static const char* const Escape;
    static const char* const ImageNext;
    static const char* const ImagePrevious;
    static const char* const ImageOriginalSize;
    static const char* const ImageFit;
    static const char* const ImageFitBest;
    static const char* const ImageDelete;
    static const char* const Pan;
    static const char* const PlayAnimation;
    static const char* const PlayPresentation;
    static const char* const PlayRandomPresentation;

    static KeyBindings defaults();
    // defaults overridden by the string lists stored in the "bindings" group
    static KeyBindings fromSettings(QSettings& settings);

    QList<QKeySequence> keys(const QString& action) const;
    // empty if no action is bound to seq
    QString action(const QKeySequence& seq) const;
    QList<QString> actions() const;

private:
    KeyBindings() = default;
    void bind(const QString& action, const QStringList& keys);

    std::map<QString, QList<QKeySequence>> bindings;
};
