#pragma once

namespace lazyverdi::tui {

// Backend session state that must be cleared around every invocation.
// reset() is called by the command runner before and after each query,
// always from the thread that runs the query.
class SessionScope {
public:
    virtual ~SessionScope() = default;
    virtual void reset() = 0;
};

} // namespace lazyverdi::tui
