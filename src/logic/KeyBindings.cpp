#include "KeyBindings.hpp"

#include <QSettings>
#include <QDebug>

const char* const KeyBindings::ToggleFullscreen = "toggle_fullscreen";
const char* const KeyBindings::Escape = "escape";
const char* const KeyBindings::ImageNext = "img_next";
const char* const KeyBindings::ImagePrevious = "img_prev";
const char* const KeyBindings::ImageOriginalSize = "img_orig";
const char* const KeyBindings::ImageFit = "img_fit";
const char* const KeyBindings::ImageFitBest = "img_fit_best";
const char* const KeyBindings::ImageDelete = "img_del";
const char* const KeyBindings::Pan = "pan";
const char* const KeyBindings::PlayAnimation = "play_anim";
const char* const KeyBindings::PlayPresentation = "play_present";
const char* const KeyBindings::PlayRandomPresentation = "play_present_rnd";

KeyBindings KeyBindings::defaults()
{
    KeyBindings kb;
    kb.bind(ToggleFullscreen, {"F11", "Return"});
    kb.bind(Escape, {"Escape"});
    kb.bind(ImageNext, {"D", "Right", "PgDown"});
    kb.bind(ImagePrevious, {"A", "Left", "PgUp"});
    kb.bind(ImageOriginalSize, {"Q", "1"});
    kb.bind(ImageFit, {"F"});
    kb.bind(ImageFitBest, {"E"});
    kb.bind(ImageDelete, {"Del"});
    kb.bind(Pan, {"Space"});
    kb.bind(PlayAnimation, {"Alt+A", "Alt+V"});
    kb.bind(PlayPresentation, {"P"});
    kb.bind(PlayRandomPresentation, {"Alt+P"});
    return kb;
}

KeyBindings KeyBindings::fromSettings(QSettings& settings)
{
    KeyBindings kb = defaults();

    settings.beginGroup("bindings");
    const QStringList overridden = settings.childKeys();
    for(const QString& action : overridden)
    {
        if(kb.bindings.find(action) == kb.bindings.end())
        {
            qWarning() << "Ignoring key binding for unknown action" << action;
            continue;
        }
        kb.bind(action, settings.value(action).toStringList());
    }
    settings.endGroup();

    return kb;
}

void KeyBindings::bind(const QString& action, const QStringList& keys)
{
    QList<QKeySequence> seqs;
    for(const QString& k : keys)
    {
        QKeySequence seq = QKeySequence::fromString(k, QKeySequence::PortableText);
        if(seq.isEmpty())
        {
            qWarning() << "Cannot parse key sequence" << k << "for action" << action;
            continue;
        }
        seqs.append(seq);
    }
    this->bindings[action] = seqs;
}

QList<QKeySequence> KeyBindings::keys(const QString& action) const
{
    auto it = this->bindings.find(action);
    return it == this->bindings.end() ? QList<QKeySequence>() : it->second;
}

QString KeyBindings::action(const QKeySequence& seq) const
{
    for(const auto& [name, seqs] : this->bindings)
    {
        if(seqs.contains(seq))
        {
            return name;
        }
    }
    return QString();
}

QList<QString> KeyBindings::actions() const
{
    QList<QString> result;
    for(const auto& entry : this->bindings)
    {
        result.append(entry.first);
    }
    return result;
}
