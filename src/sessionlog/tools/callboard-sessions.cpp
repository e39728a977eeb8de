/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later

    callboard-sessions - inspect the session log store from the command line

    Usage:
        callboard-sessions list [--limit N] [--offset N]
        callboard-sessions timeline <session-id>...
        callboard-sessions chat <chat-id> [--no-status]
        callboard-sessions preview <log-path> [--length N]
        callboard-sessions status <directory>

    Output is JSON on stdout. Defaults come from callboardrc.
*/

#include "CallboardSettings.h"
#include "ChatFileStore.h"
#include "ConversationMessage.h"
#include "SessionLocator.h"
#include "SessionLogStore.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTextStream>

using namespace Callboard;

// Print a JSON document to stdout
void printJson(const QJsonDocument &doc)
{
    QTextStream out(stdout);
    out << doc.toJson(QJsonDocument::Indented);
}

int printError(const QString &message)
{
    QTextStream err(stderr);
    err << "Error: " << message << "\n";
    return 1;
}

int readNonNegativeInt(const QString &value, int fallback)
{
    bool ok = false;
    const int parsed = value.toInt(&ok);
    return (ok && parsed >= 0) ? parsed : fallback;
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("callboard-sessions"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    CallboardSettings settings;

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Inspect Claude session logs for Callboard"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("One of: list, timeline, chat, preview, status"));
    parser.addPositionalArgument(QStringLiteral("arguments"), QStringLiteral("Command arguments"), QStringLiteral("[arguments...]"));

    QCommandLineOption rootOption(QStringList() << QStringLiteral("r") << QStringLiteral("root"),
                                  QStringLiteral("Session log root (default: from callboardrc)"),
                                  QStringLiteral("path"),
                                  settings.projectsDirectory());
    parser.addOption(rootOption);

    QCommandLineOption dataOption(QStringList() << QStringLiteral("d") << QStringLiteral("data-dir"),
                                  QStringLiteral("Callboard data directory (default: from callboardrc)"),
                                  QStringLiteral("path"),
                                  settings.dataDirectory());
    parser.addOption(dataOption);

    QCommandLineOption limitOption(QStringList() << QStringLiteral("l") << QStringLiteral("limit"),
                                   QStringLiteral("Page size for list"),
                                   QStringLiteral("n"),
                                   QString::number(settings.pageSize()));
    parser.addOption(limitOption);

    QCommandLineOption offsetOption(QStringList() << QStringLiteral("o") << QStringLiteral("offset"),
                                    QStringLiteral("Page offset for list"),
                                    QStringLiteral("n"),
                                    QStringLiteral("0"));
    parser.addOption(offsetOption);

    QCommandLineOption lengthOption(QStringList() << QStringLiteral("length"),
                                    QStringLiteral("Maximum preview length"),
                                    QStringLiteral("n"),
                                    QString::number(settings.previewLength()));
    parser.addOption(lengthOption);

    QCommandLineOption strategyOption(QStringList() << QStringLiteral("strategy"),
                                      QStringLiteral("Listing strategy: auto, find or scan"),
                                      QStringLiteral("name"),
                                      settings.listingStrategy());
    parser.addOption(strategyOption);

    QCommandLineOption noStatusOption(QStringList() << QStringLiteral("no-status"), QStringLiteral("Skip repository status for chat"));
    parser.addOption(noStatusOption);

    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(1);
    }

    const QString command = args.first();
    const QStringList commandArgs = args.mid(1);

    SessionLogStore store(parser.value(rootOption),
                          nullptr,
                          SessionLocator::modeFromString(parser.value(strategyOption)),
                          static_cast<qint64>(settings.statusTtlSeconds()) * 1000);
    ChatFileStore chats(parser.value(dataOption));
    store.setChatStore(&chats);

    if (command == QLatin1String("list")) {
        const int limit = readNonNegativeInt(parser.value(limitOption), settings.pageSize());
        const int offset = readNonNegativeInt(parser.value(offsetOption), 0);
        const SessionPage page = store.listSessions(limit, offset);

        QJsonArray sessions;
        for (const SessionDescriptor &descriptor : page.sessions) {
            sessions.append(descriptor.toJson());
        }

        QJsonObject result;
        result[QStringLiteral("sessions")] = sessions;
        result[QStringLiteral("total")] = page.total;
        result[QStringLiteral("hasMore")] = page.hasMore;
        printJson(QJsonDocument(result));
        return 0;
    }

    if (command == QLatin1String("timeline")) {
        if (commandArgs.isEmpty()) {
            return printError(QStringLiteral("timeline needs at least one session id"));
        }

        QJsonArray messages;
        const QList<ConversationMessage> timeline = store.conversationTimeline(commandArgs);
        for (const ConversationMessage &message : timeline) {
            messages.append(message.toJson());
        }
        printJson(QJsonDocument(messages));
        return 0;
    }

    if (command == QLatin1String("chat")) {
        if (commandArgs.size() != 1) {
            return printError(QStringLiteral("chat needs exactly one chat id"));
        }

        const ChatLookup chat = store.findChat(commandArgs.first(), !parser.isSet(noStatusOption));
        if (!chat.isValid()) {
            return printError(QStringLiteral("no chat or session named %1").arg(commandArgs.first()));
        }
        printJson(QJsonDocument(chat.toJson()));
        return 0;
    }

    if (command == QLatin1String("preview")) {
        if (commandArgs.size() != 1) {
            return printError(QStringLiteral("preview needs exactly one log path"));
        }

        const int length = readNonNegativeInt(parser.value(lengthOption), settings.previewLength());
        const QString text = store.preview(commandArgs.first(), length);

        QJsonObject result;
        result[QStringLiteral("path")] = commandArgs.first();
        result[QStringLiteral("preview")] = text.isNull() ? QJsonValue(QJsonValue::Null) : QJsonValue(text);
        printJson(QJsonDocument(result));
        return 0;
    }

    if (command == QLatin1String("status")) {
        if (commandArgs.size() != 1) {
            return printError(QStringLiteral("status needs exactly one directory"));
        }

        const RepositoryStatus status = store.directoryStatus(commandArgs.first());
        QJsonObject result;
        result[QStringLiteral("path")] = commandArgs.first();
        result[QStringLiteral("is_git_repo")] = status.isRepo;
        if (status.isRepo) {
            result[QStringLiteral("git_branch")] = status.branch;
        }
        printJson(QJsonDocument(result));
        return 0;
    }

    return printError(QStringLiteral("unknown command %1").arg(command));
}
