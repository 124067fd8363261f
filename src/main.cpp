#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSettings>
#include <QString>
#include <QTextStream>
#include <memory>

#include "version.h"

#include "planner/Logging.hpp"
#include "planner/core/PlannerContext.hpp"
#include "planner/core/PlanningService.hpp"
#include "planner/core/SchedulerSettings.hpp"
#include "planner/data/JsonCodec.hpp"
#include "planner/data/TaskRepository.hpp"

namespace {

bool readRequestFile(const QString &path, QJsonObject &request, QString &error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        error = file.errorString();
        return false;
    }
    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        error = parseError.errorString();
        return false;
    }
    if (!document.isObject()) {
        error = QStringLiteral("request must be a JSON object");
        return false;
    }
    request = document.object();
    return true;
}

// Numbers go through as numbers; anything else is passed on verbatim so the
// service can reject it.
QJsonValue minutesArgument(const QString &text)
{
    bool ok = false;
    const int minutes = text.toInt(&ok);
    if (ok) {
        return minutes;
    }
    return text;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Zellhoff"));
    QCoreApplication::setOrganizationDomain(QStringLiteral("zellhoff.at"));
    QCoreApplication::setApplicationName(QStringLiteral("Block Planner"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kBlockPlannerVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QCoreApplication::translate(
        "main", "Plans pending tasks into a time budget, day slots or focus sessions."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("operation"),
                                 QCoreApplication::translate(
                                     "main", "schedule, slots, sessions, split, analyze, recommend, stats or estimate."));

    const QCommandLineOption requestOption({ QStringLiteral("r"), QStringLiteral("request") },
                                           QCoreApplication::translate("main", "Read the whole request from <file>."),
                                           QStringLiteral("file"));
    const QCommandLineOption tasksOption({ QStringLiteral("t"), QStringLiteral("tasks") },
                                         QCoreApplication::translate("main", "Task file to plan from."),
                                         QStringLiteral("file"));
    const QCommandLineOption configOption({ QStringLiteral("c"), QStringLiteral("config") },
                                          QCoreApplication::translate("main", "INI file with scheduler settings."),
                                          QStringLiteral("file"));
    const QCommandLineOption budgetOption({ QStringLiteral("b"), QStringLiteral("budget") },
                                          QCoreApplication::translate("main", "Available time in minutes."),
                                          QStringLiteral("minutes"));
    const QCommandLineOption todayOption(QStringLiteral("today"),
                                         QCoreApplication::translate("main", "Plan as of <date> (YYYY-MM-DD)."),
                                         QStringLiteral("date"));
    const QCommandLineOption sessionOption(QStringLiteral("session-length"),
                                           QCoreApplication::translate("main", "Focus session length in minutes."),
                                           QStringLiteral("minutes"));
    const QCommandLineOption breakOption(QStringLiteral("break-length"),
                                         QCoreApplication::translate("main", "Short break length in minutes."),
                                         QStringLiteral("minutes"));
    const QCommandLineOption maxSessionOption(QStringLiteral("max-session"),
                                              QCoreApplication::translate("main", "Longest part when splitting."),
                                              QStringLiteral("minutes"));
    const QCommandLineOption taskIdOption(QStringLiteral("task"),
                                          QCoreApplication::translate("main", "Id of the task to split."),
                                          QStringLiteral("id"));
    const QCommandLineOption compactOption(QStringLiteral("compact"),
                                           QCoreApplication::translate("main", "Print compact JSON."));
    parser.addOptions({ requestOption, tasksOption, configOption, budgetOption, todayOption, sessionOption,
                        breakOption, maxSessionOption, taskIdOption, compactOption });
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    std::unique_ptr<QSettings> settingsStore;
    if (parser.isSet(configOption)) {
        settingsStore = std::make_unique<QSettings>(parser.value(configOption), QSettings::IniFormat);
    } else {
        settingsStore = std::make_unique<QSettings>();
    }
    const auto settings = planner::core::loadSchedulerSettings(*settingsStore);

    const QStringList positional = parser.positionalArguments();
    QJsonObject request;
    if (parser.isSet(requestOption)) {
        QString error;
        if (!readRequestFile(parser.value(requestOption), request, error)) {
            err << QCoreApplication::translate("main", "Cannot read request: %1").arg(error) << Qt::endl;
            return 2;
        }
    } else if (positional.isEmpty()) {
        parser.showHelp(1);
    }
    if (!positional.isEmpty()) {
        request.insert(QStringLiteral("operation"), positional.first());
    }

    const QString taskFile = parser.isSet(tasksOption) ? parser.value(tasksOption)
                                                       : planner::core::PlannerContext::defaultTaskFilePath();
    planner::core::PlannerContext context(parser.isSet(requestOption) && !parser.isSet(tasksOption) ? QString() : taskFile,
                                          settings);

    const QString operation = request.value(QStringLiteral("operation")).toString();
    if (!request.contains(QStringLiteral("tasks")) && !request.contains(QStringLiteral("task"))) {
        if (operation == QLatin1String("split")) {
            const auto task = context.taskRepository().findById(parser.value(taskIdOption));
            if (!task) {
                err << QCoreApplication::translate("main", "No task with id '%1'").arg(parser.value(taskIdOption))
                    << Qt::endl;
                return 1;
            }
            request.insert(QStringLiteral("task"), planner::data::taskToJson(*task));
        } else {
            request.insert(QStringLiteral("tasks"), planner::data::tasksToJson(context.taskRepository().fetchTasks()));
        }
    }
    if (parser.isSet(budgetOption)) {
        request.insert(QStringLiteral("available_time"), minutesArgument(parser.value(budgetOption)));
    }
    if (parser.isSet(todayOption)) {
        request.insert(QStringLiteral("today"), parser.value(todayOption));
    }
    if (parser.isSet(sessionOption)) {
        request.insert(QStringLiteral("session_length"), minutesArgument(parser.value(sessionOption)));
    }
    if (parser.isSet(breakOption)) {
        request.insert(QStringLiteral("break_length"), minutesArgument(parser.value(breakOption)));
    }
    if (parser.isSet(maxSessionOption)) {
        request.insert(QStringLiteral("max_session_minutes"), minutesArgument(parser.value(maxSessionOption)));
    }

    const QJsonObject response = context.planningService().handleRequest(request);
    out << QJsonDocument(response).toJson(parser.isSet(compactOption) ? QJsonDocument::Compact
                                                                      : QJsonDocument::Indented);
    out.flush();

    if (!response.value(QStringLiteral("success")).toBool()) {
        qCInfo(lcService) << "Request failed:" << response.value(QStringLiteral("message")).toString();
        return 1;
    }
    return 0;
}
