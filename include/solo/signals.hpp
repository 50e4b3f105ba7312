#ifndef SOLO_SIGNALS_HPP
#define SOLO_SIGNALS_HPP

namespace solo {

// Process-wide shutdown request set from SIGTERM, SIGINT and SIGHUP.
class ShutdownSignal {
public:
    // Installs the handlers without SA_RESTART so blocking waits return EINTR.
    static void install();

    static bool requested();
    static int lastSignal();

    static void request(int signum = 0);
    static void reset();
};

} // namespace solo

#endif // SOLO_SIGNALS_HPP
