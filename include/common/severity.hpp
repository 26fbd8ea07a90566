#pragma once

// Ordered lowest to highest importance. Verbose is accepted by LogWriter but never persisted.
enum class Severity { Verbose, Debug, Info, Warn, Error };

const char* SeverityName(Severity severity);
