#pragma once

namespace ClipRelay {

// The external browser the discoverer drives.
class IRuntimeSession {
public:
    virtual ~IRuntimeSession() = default;
    virtual void Start() = 0;                  // throws PipelineError(Fatal)
    virtual void ApplyStoredCredentials() = 0; // throws PipelineError
    virtual void Stop() = 0;
    virtual bool IsRunning() const = 0;
};

}
