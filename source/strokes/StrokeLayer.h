#pragma once

// ============================================================================
// StrokeLayer - Rendering layer of a stroke
// ============================================================================
// Layers order strokes before their chrono stamp does:
// Document < Image < Highlighter < User(0) < User(1) < ...
// ============================================================================

#include <QString>
#include <QtGlobal>

struct StrokeLayer {
    enum class Kind {
        Document = 0,
        Image = 1,
        Highlighter = 2,
        User = 3
    };

    Kind kind = Kind::User;
    quint32 userLevel = 0;   ///< Only meaningful for Kind::User

    static StrokeLayer user(quint32 level) { return StrokeLayer{Kind::User, level}; }
    static StrokeLayer image() { return StrokeLayer{Kind::Image, 0}; }
    static StrokeLayer highlighter() { return StrokeLayer{Kind::Highlighter, 0}; }
    static StrokeLayer document() { return StrokeLayer{Kind::Document, 0}; }

    bool operator==(const StrokeLayer& other) const {
        return kind == other.kind && (kind != Kind::User || userLevel == other.userLevel);
    }
    bool operator!=(const StrokeLayer& other) const { return !(*this == other); }
    bool operator<(const StrokeLayer& other) const {
        if (kind != other.kind) {
            return static_cast<int>(kind) < static_cast<int>(other.kind);
        }
        return kind == Kind::User && userLevel < other.userLevel;
    }

    /// One user level up. Predefined layers move to the lowest user layer.
    StrokeLayer userUp() const {
        if (kind == Kind::User) {
            return user(userLevel == 0xFFFFFFFFu ? userLevel : userLevel + 1);
        }
        return user(0);
    }

    /// One user level down. Never leaves the user layers.
    StrokeLayer userDown() const {
        if (kind == Kind::User) {
            return user(userLevel == 0 ? 0 : userLevel - 1);
        }
        return *this;
    }

    /// "user:N", "highlighter", "image" or "document".
    QString toString() const {
        switch (kind) {
            case Kind::Document:    return QStringLiteral("document");
            case Kind::Image:       return QStringLiteral("image");
            case Kind::Highlighter: return QStringLiteral("highlighter");
            case Kind::User:        return QStringLiteral("user:%1").arg(userLevel);
        }
        return QStringLiteral("user:0");
    }

    static StrokeLayer fromString(const QString& str) {
        if (str == "document")    return document();
        if (str == "image")       return image();
        if (str == "highlighter") return highlighter();
        if (str.startsWith("user:")) {
            bool ok = false;
            const quint32 level = str.mid(5).toUInt(&ok);
            return user(ok ? level : 0);
        }
        return user(0);
    }
};
