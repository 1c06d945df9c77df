// SPDX-License-Identifier: Apache-2.0
#include <hub/Connection.hpp>
#include <hub/HttpConnection.hpp>
#include <hub/SseConnection.hpp>
#include <hub/StdioConnection.hpp>

#include <utility>

namespace mcphub
{

DefaultConnectionFactory::DefaultConnectionFactory(ConnectionOptions options,
                                                   std::shared_ptr<HttpClient> httpClient):
    _options(std::move(options)), _httpClient(std::move(httpClient))
{
}

auto DefaultConnectionFactory::connect(const ServerDefinition& definition) -> Result<std::shared_ptr<Connection>>
{
    auto valid = validateDefinition(definition);
    if (!valid)
        return std::unexpected(valid.error());

    switch (definition.transportKind)
    {
        case TransportKind::Stdio: return StdioConnection::open(definition, _options);
        case TransportKind::Http: return HttpConnection::open(definition, _options, _httpClient);
        case TransportKind::Sse: return SseConnection::open(definition, _options, _httpClient);
    }
    return makeError(ErrorCode::InvalidArgument, "Unknown transport kind");
}

} // namespace mcphub
