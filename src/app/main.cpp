#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QDebug>
#include <QtCore/QDir>
#include <QtCore/QStandardPaths>

#include <QtWidgets/QApplication>
#include <QtWidgets/QMainWindow>
#include <QtWidgets/QSplitter>

#include <tandem/TandemSettings.hpp>
#include <tandem/document/TandemDocument.hpp>
#include <tandem/presence/PresenceHub.hpp>

#include "CanvasWidget.hpp"

using namespace Tandem;
using namespace Qt::StringLiterals;

static QString defaultSettingsPath()
{
	const QString dir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
	if (dir.isEmpty())
		return {};
	return QDir(dir).filePath(u"tandem.json"_s);
}

static void populate(TandemDocument& doc)
{
	doc.createShape(QPointF(80.0, 80.0), ShapeKind::Circle, 120.0, u"#2F6FEB"_s);
	doc.createShape(QPointF(260.0, 90.0), ShapeKind::Star, 110.0, u"#E8A21A"_s);
	doc.createNote(QPointF(80.0, 260.0), u"Drag me from either window"_s, u"#FFE58A"_s);
	doc.createText(QPointF(320.0, 260.0), u"Resize from the side handles"_s, 320.0, 18.0);
	doc.createTable(QPointF(320.0, 380.0), 3, 4);

	if (TandemItem* group = doc.createGroup(QPointF(620.0, 80.0), u"Loose group"_s)) {
		doc.createShape(QPointF(0.0, 0.0), ShapeKind::Square, 80.0, u"#3BA55C"_s, group->id());
		doc.createShape(QPointF(120.0, 40.0), ShapeKind::Triangle, 80.0, u"#D9534F"_s, group->id());
	}
	if (TandemItem* grid = doc.createGroup(QPointF(620.0, 360.0), u"Grid group"_s, true)) {
		for (int i = 0; i < 4; ++i)
			doc.createShape(QPointF(), ShapeKind::Circle, 90.0, u"#7A5AF8"_s, grid->id());
	}
}

int main(int argc, char** argv)
{
	QApplication app(argc, argv);
	QCoreApplication::setApplicationName(u"tandem"_s);

	QCommandLineParser parser;
	parser.setApplicationDescription(u"Two collaborating views over one shared canvas document."_s);
	parser.addHelpOption();
	QCommandLineOption settingsOption(u"settings"_s, u"Interaction settings file (JSON)."_s, u"path"_s);
	QCommandLineOption writeDefaultsOption(u"write-default-settings"_s,
										   u"Write the default settings to the settings path and exit."_s);
	parser.addOption(settingsOption);
	parser.addOption(writeDefaultsOption);
	parser.process(app);

	const QString settingsPath = parser.isSet(settingsOption) ? parser.value(settingsOption)
															  : defaultSettingsPath();

	if (parser.isSet(writeDefaultsOption)) {
		const Utils::Result r = saveSettings(settingsPath, settingsDefaults());
		if (!r) {
			qCritical().noquote() << "Failed to write settings:" << r.message();
			return EXIT_FAILURE;
		}
		return EXIT_SUCCESS;
	}

	Utils::Result loadResult;
	const TandemSettings settings = settingsPath.isEmpty()
		? settingsDefaults()
		: loadSettings(settingsPath, settingsDefaults(), &loadResult);
	if (!loadResult) {
		qCritical().noquote() << "Settings file is unusable:" << loadResult.message();
		return EXIT_FAILURE;
	}

	TandemDocument document;
	populate(document);

	// Queued delivery so each view sees the other's presence asynchronously.
	PresenceHub hub(PresenceHub::DeliveryMode::Queued);

	QMainWindow window;
	window.setWindowTitle(u"Tandem"_s);
	auto* splitter = new QSplitter(Qt::Horizontal, &window);
	auto* left = new TandemApp::CanvasWidget(document, hub, settings, splitter);
	auto* right = new TandemApp::CanvasWidget(document, hub, settings, splitter);
	left->setObjectName(u"LeftCanvas"_s);
	right->setObjectName(u"RightCanvas"_s);
	splitter->addWidget(left);
	splitter->addWidget(right);
	window.setCentralWidget(splitter);
	window.resize(1600, 800);
	window.show();

	return app.exec();
}
