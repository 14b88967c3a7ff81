// Copyright (c) 2025 VAM Spatial Live
// SessionBridge - Qt/QML bridge to SessionCoordinator

#pragma once

#include <QObject>
#include <QString>
#include <QVariantList>
#include <memory>
#include <vector>

// Forward declarations
namespace app {
    class SessionCoordinator;
    struct TranscriptEntry;
    struct SessionError;
    enum class ConnectionState;
}
namespace vision {
    struct TrackedObject;
}

class SessionBridge : public QObject {
    Q_OBJECT

    // Properties exposed to QML
    Q_PROPERTY(int state READ state NOTIFY stateChanged)
    Q_PROPERTY(QString stateName READ stateName NOTIFY stateChanged)
    Q_PROPERTY(bool isActive READ isActive NOTIFY stateChanged)
    Q_PROPERTY(double aspectRatio READ aspectRatio NOTIFY aspectRatioChanged)
    Q_PROPERTY(QVariantList objects READ objects NOTIFY objectsChanged)
    Q_PROPERTY(QString model READ model WRITE setModel NOTIFY modelChanged)
    Q_PROPERTY(QString voice READ voice WRITE setVoice NOTIFY voiceChanged)
    Q_PROPERTY(QString scriptFile READ scriptFile WRITE setScriptFile NOTIFY scriptFileChanged)

public:
    explicit SessionBridge(QObject* parent = nullptr);
    ~SessionBridge();

    // Property getters
    int state() const { return state_; }
    QString stateName() const;
    bool isActive() const;
    double aspectRatio() const { return aspect_ratio_; }
    QVariantList objects() const { return objects_; }
    QString model() const { return model_; }
    QString voice() const { return voice_; }
    QString scriptFile() const { return script_file_; }

    // Property setters
    void setModel(const QString& model);
    void setVoice(const QString& voice);
    void setScriptFile(const QString& path);

public slots:
    void startSession();
    void stopSession();
    void clearHistory();

signals:
    // Property change notifications
    void stateChanged();
    void aspectRatioChanged();
    void objectsChanged();
    void modelChanged();
    void voiceChanged();
    void scriptFileChanged();

    // Session events (forwarded from coordinator)
    void transcriptAdded(QString role, QString text);
    void historyCleared();
    void errorOccurred(int severity, QString message, QString details);

private:
    // Callback handlers (convert C++ events to Qt signals)
    void onStateChanged(app::ConnectionState state);
    void onObjectsChanged(const std::vector<vision::TrackedObject>& objects);
    void onTranscript(const app::TranscriptEntry& entry);
    void onError(const app::SessionError& error);

    std::unique_ptr<app::SessionCoordinator> session_;

    // State
    int state_ = 0;
    double aspect_ratio_ = 16.0 / 9.0;
    QVariantList objects_;

    // Configuration
    QString model_;
    QString voice_ = "Kore";
    QString script_file_;
};
