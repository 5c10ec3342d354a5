#include "request_router.h"
#include "core/log_manager.h"

void RequestRouter::registerDefaults()
{
    m_routes.clear();

    addRoute({QStringLiteral("GET"), QStringLiteral("/"), RouteKind::Health});

    // Client-protocol translation path
    addRoute({QStringLiteral("POST"), QStringLiteral("/v1/messages"), RouteKind::Messages});

    addRoute({QStringLiteral("GET"), QStringLiteral("/v1/models"), RouteKind::Models});
    addRoute({QStringLiteral("GET"), QStringLiteral("/models"), RouteKind::Models});

    // Backend-protocol pass-through
    addRoute({QStringLiteral("POST"), QStringLiteral("/v1/chat/completions"), RouteKind::ChatCompletions});
    addRoute({QStringLiteral("POST"), QStringLiteral("/chat/completions"), RouteKind::ChatCompletions});

    LOG_INFO(QStringLiteral("RequestRouter: registered %1 default routes")
                 .arg(m_routes.size()));
}

void RequestRouter::addRoute(const Route& route)
{
    InternalRoute entry;
    entry.route = route;
    entry.method = route.method.isEmpty() ? QStringLiteral("*") : route.method.trimmed().toUpper();

    if (route.pathPattern.endsWith(QLatin1Char('*'))) {
        entry.wildcard = true;
        entry.pathPrefix = route.pathPattern.left(route.pathPattern.size() - 1);
    } else {
        entry.wildcard = false;
        entry.pathPrefix = route.pathPattern;
    }

    m_routes.append(entry);
}

QString RequestRouter::normalizePath(const QString& path)
{
    QString normalized = path;
    const int query = normalized.indexOf(QLatin1Char('?'));
    if (query >= 0)
        normalized.truncate(query);
    while (normalized.size() > 1 && normalized.endsWith(QLatin1Char('/')))
        normalized.chop(1);
    if (normalized.isEmpty())
        normalized = QStringLiteral("/");
    return normalized;
}

std::optional<Route> RequestRouter::match(const QString& method, const QString& path) const
{
    const QString normalizedMethod = method.trimmed().toUpper();
    const QString normalizedPath = normalizePath(path);

    for (const InternalRoute& entry : m_routes) {
        if (entry.method != QStringLiteral("*") && entry.method != normalizedMethod)
            continue;

        if (entry.wildcard) {
            if (normalizedPath.startsWith(entry.pathPrefix))
                return entry.route;
        } else if (normalizedPath == entry.pathPrefix) {
            return entry.route;
        }
    }

    return std::nullopt;
}
