#ifndef RESTICD_LOCK_H
#define RESTICD_LOCK_H

#include <string>

// Returns 1 when the lock was taken, 0 when a live process holds it and -1 on
// error (errno is left set).
int lock_file(const std::string &path);
void unlock_file(const std::string &path);

#endif
