// Copyright (c) 2025 VAM Spatial Live
// SessionBridge - Implementation

#include "ui/session_bridge.hpp"
#include "app/session_coordinator.hpp"
#include "core/config.hpp"
#include "net/scripted_channel.hpp"
#include "vision/detection.hpp"

#include <QDebug>
#include <QFile>
#include <QMetaObject>
#include <QVariantMap>

using namespace app;

SessionBridge::SessionBridge(QObject* parent)
    : QObject(parent)
    , model_(QString::fromStdString(core::SessionConfig().model))
{
    SessionDevices devices;
    devices.make_channel = [this]() -> std::unique_ptr<net::IRealtimeChannel> {
        auto channel = std::make_unique<net::ScriptedChannel>(net::ScriptedChannel::demo_script());
        if (script_file_.isEmpty()) {
            return channel;
        }
        QFile file(script_file_);
        if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
            qWarning() << "Cannot read script" << script_file_ << "- using built-in demo";
            return channel;
        }
        std::vector<net::ScriptStep> steps;
        std::string error;
        if (!net::ScriptedChannel::parse_script(file.readAll().toStdString(), steps, error)) {
            qWarning() << "Bad script" << script_file_ << ":" << QString::fromStdString(error);
            return channel;
        }
        channel->set_script(std::move(steps));
        return channel;
    };
    session_ = std::make_unique<SessionCoordinator>(std::move(devices));

    // Subscribe to session events, marshalled to the Qt main thread
    session_->subscribe_to_state([this](ConnectionState state) {
        QMetaObject::invokeMethod(this, [this, state]() {
            onStateChanged(state);
        }, Qt::QueuedConnection);
    });

    session_->subscribe_to_objects([this](const std::vector<vision::TrackedObject>& objects) {
        QMetaObject::invokeMethod(this, [this, objects]() {
            onObjectsChanged(objects);
        }, Qt::QueuedConnection);
    });

    session_->subscribe_to_transcript([this](const TranscriptEntry& entry) {
        QMetaObject::invokeMethod(this, [this, entry]() {
            onTranscript(entry);
        }, Qt::QueuedConnection);
    });

    session_->subscribe_to_errors([this](const SessionError& error) {
        QMetaObject::invokeMethod(this, [this, error]() {
            onError(error);
        }, Qt::QueuedConnection);
    });
}

SessionBridge::~SessionBridge() {
    session_->clear_subscriptions();
    session_->stop();
}

//==============================================================================
// Properties
//==============================================================================

QString SessionBridge::stateName() const {
    return QString::fromLatin1(to_string(static_cast<ConnectionState>(state_)));
}

bool SessionBridge::isActive() const {
    auto state = static_cast<ConnectionState>(state_);
    return state == ConnectionState::CONNECTING || state == ConnectionState::CONNECTED;
}

void SessionBridge::setModel(const QString& model) {
    if (model_ != model) {
        model_ = model;
        emit modelChanged();
    }
}

void SessionBridge::setVoice(const QString& voice) {
    if (voice_ != voice) {
        voice_ = voice;
        emit voiceChanged();
    }
}

void SessionBridge::setScriptFile(const QString& path) {
    if (script_file_ != path) {
        script_file_ = path;
        emit scriptFileChanged();
    }
}

//==============================================================================
// Session Control
//==============================================================================

void SessionBridge::startSession() {
    if (isActive()) {
        qWarning() << "Session already active!";
        return;
    }

    core::SessionConfig config;
    config.model = model_.toStdString();
    config.voice = voice_.toStdString();

    if (session_->start(config)) {
        aspect_ratio_ = session_->get_video_aspect_ratio();
        emit aspectRatioChanged();
        qDebug() << "Session starting";
    } else {
        qWarning() << "Failed to start session!";
    }
}

void SessionBridge::stopSession() {
    session_->stop();
    qDebug() << "Session stopped";
}

void SessionBridge::clearHistory() {
    session_->clear_history();
    emit historyCleared();
}

//==============================================================================
// Event Handlers (Convert C++ -> Qt Signals)
//==============================================================================

void SessionBridge::onStateChanged(ConnectionState state) {
    int value = static_cast<int>(state);
    if (state_ != value) {
        state_ = value;
        emit stateChanged();
    }
}

void SessionBridge::onObjectsChanged(const std::vector<vision::TrackedObject>& objects) {
    QVariantList list;
    list.reserve(static_cast<int>(objects.size()));
    for (const auto& obj : objects) {
        vision::PercentRect rect = vision::to_percent_rect(obj);
        QVariantMap item;
        item["id"] = QVariant::fromValue<quint64>(obj.id);
        item["label"] = QString::fromStdString(obj.label);
        item["left"] = rect.left;
        item["top"] = rect.top;
        item["width"] = rect.width;
        item["height"] = rect.height;
        list.append(item);
    }
    objects_ = list;
    emit objectsChanged();
}

void SessionBridge::onTranscript(const TranscriptEntry& entry) {
    emit transcriptAdded(
        entry.role == TranscriptEntry::Role::USER ? "user" : "model",
        QString::fromStdString(entry.text)
    );
}

void SessionBridge::onError(const SessionError& error) {
    emit errorOccurred(
        static_cast<int>(error.severity),
        QString::fromStdString(error.message),
        QString::fromStdString(error.details)
    );
}
