#ifndef INCLUDE_SNIPBOX_LOGGER_H_
#define INCLUDE_SNIPBOX_LOGGER_H_

// Call once from the main thread before any sandbox is started.
void InitLogger();

#endif  // INCLUDE_SNIPBOX_LOGGER_H_
