#ifndef INCLUDE_CODEEXEC_LOGGER_H_
#define INCLUDE_CODEEXEC_LOGGER_H_

// Must be called before any thread that forks is started
void InitLogger();

#endif  // INCLUDE_CODEEXEC_LOGGER_H_
