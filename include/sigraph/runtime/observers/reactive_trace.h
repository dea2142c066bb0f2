#pragma once

#include <sigraph/runtime/observers/reactive_observer.h>

#include <cstddef>
#include <optional>
#include <string>

namespace sigraph {

    /**
     * @brief Logs every write, recompute, reaction run, flush and disposal of a context.
     *
     * This is voluminous but helps tracking down unexpected re-runs or missing notifications. Each line reads
     * "[seq] kind#id:label message".
     */
    class SIGRAPH_EXPORT ReactiveTrace : public ReactiveObserver {
    public:
        /**
         * @param filter Only report nodes whose name contains this (flush events are not filtered)
         * @param signals Log signal writes and disposals
         * @param computeds Log recomputes and disposals of computeds
         * @param reactions Log reaction runs and disposals
         * @param flushes Log batch flushes and flush errors
         */
        explicit ReactiveTrace(const std::optional<std::string> &filter = std::nullopt, bool signals = true,
                               bool computeds = true, bool reactions = true, bool flushes = true);

        void on_signal_write(const ReactiveBase &node) override;
        void on_before_recompute(const ReactiveBase &node) override;
        void on_after_recompute(const ReactiveBase &node) override;
        void on_before_reaction_run(const ReactiveBase &node) override;
        void on_after_reaction_run(const ReactiveBase &node) override;
        void on_before_flush(std::size_t pending) override;
        void on_after_flush(std::size_t delivered) override;
        void on_flush_error(const std::exception &error) override;
        void on_dispose(const ReactiveBase &node) override;

        // Static configuration
        static void set_use_logger(bool value);

    private:
        std::optional<std::string> _filter;
        bool _signals;
        bool _computeds;
        bool _reactions;
        bool _flushes;
        std::size_t _sequence{0};

        static bool _use_logger;

        void _print(const std::string &msg);
        void _print_node(const ReactiveBase &node, const std::string &msg);
        [[nodiscard]] bool _should_log(const ReactiveBase &node) const;
    };

} // namespace sigraph
