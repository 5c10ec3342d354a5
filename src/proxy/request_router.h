#pragma once
#include <QString>
#include <QList>
#include <optional>

enum class RouteKind {
    Health,
    Messages,
    Models,
    ChatCompletions,
};

struct Route {
    QString method;
    QString pathPattern;
    RouteKind kind = RouteKind::Health;
};

class RequestRouter {
public:
    void registerDefaults();
    void addRoute(const Route& route);
    std::optional<Route> match(const QString& method, const QString& path) const;
    int routeCount() const { return m_routes.size(); }

    // Path without query string or trailing slash ("/" stays "/").
    static QString normalizePath(const QString& path);

private:
    struct InternalRoute {
        QString method;        // "GET", "POST" or "*" for any
        QString pathPrefix;
        bool wildcard = false; // true if pathPattern ends with "*"
        Route route;
    };
    QList<InternalRoute> m_routes;
};
