/**
 * @file main.cpp
 * @brief BlueScan Qt Application Entry Point
 */

#include "mainwindow.h"
#include <QApplication>
#include <QStyleFactory>

int main(int argc, char *argv[]) {
  QApplication app(argc, argv);

  app.setApplicationName("BlueScan");
  app.setApplicationVersion("1.0.0");
  app.setOrganizationName("BlueScan");

  // Use Fusion style for consistent cross-platform look
  app.setStyle(QStyleFactory::create("Fusion"));

  MainWindow window;
  window.show();

  return app.exec();
}
