#include <QByteArray>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QDebug>

#include <cstdio>

#include "JsonCodec.hpp"

// Usage : lcoe_json [request.json]   (sans argument : lit stdin)
// Écrit la réponse JSON sur stdout ; code retour 0 / 2 (422) / 3 (500).
int main(int argc, char** argv) {
  QFile in;
  bool opened = false;
  if (argc > 1) {
    in.setFileName(QString::fromLocal8Bit(argv[1]));
    opened = in.open(QIODevice::ReadOnly);
  } else {
    opened = in.open(stdin, QIODevice::ReadOnly);
  }
  if (!opened) {
    qCritical() << "[lcoe_json] cannot open input:" << in.errorString();
    return 1;
  }
  const QByteArray body = in.readAll();
  in.close();

  const QJsonObject response = service::handleRequest(body);

  QFile out;
  if (!out.open(stdout, QIODevice::WriteOnly)) {
    qCritical() << "[lcoe_json] cannot open stdout";
    return 1;
  }
  out.write(QJsonDocument(response).toJson(QJsonDocument::Indented));
  out.close();

  switch (response.value("status").toInt()) {
    case service::StatusOk:             return 0;
    case service::StatusInvalidRequest: return 2;
    default:                            return 3;
  }
}
