#pragma once

#include <sigraph/sigraph_base.h>
#include <sigraph/types/computed.h>
#include <sigraph/types/signal.h>
#include <sigraph/types/subscription.h>

#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace sigraph {

/**
 * @brief Value at a dotted path, e.g. "user.addresses.0.city". Numeric segments index arrays.
 * @return null when a segment is missing, the empty path returns root.
 */
[[nodiscard]] SIGRAPH_EXPORT nlohmann::json value_at_path(const nlohmann::json &root, std::string_view path);

using path_callback = std::function<void(const nlohmann::json &, const nlohmann::json &)>;

/**
 * @brief Call callback(value, previous) when the value at path inside the signal changes.
 *
 * Writes that change other parts of the document are filtered out.
 */
SIGRAPH_EXPORT Subscription watch_path(Signal<nlohmann::json> &signal, std::string path, path_callback callback);

/**
 * @brief A Computed following the value at path inside the signal.
 * @note The Computed reads the signal by reference on every recompute, the signal must outlive it.
 */
[[nodiscard]] SIGRAPH_EXPORT std::unique_ptr<Computed<nlohmann::json>> derived_path(Signal<nlohmann::json> &signal,
                                                                                    std::string path);

/**
 * @brief As above, the Computed shares ownership of the signal (as handed out by NamedCollection).
 */
[[nodiscard]] SIGRAPH_EXPORT std::unique_ptr<Computed<nlohmann::json>>
derived_path(std::shared_ptr<Signal<nlohmann::json>> signal, std::string path);

} // namespace sigraph
