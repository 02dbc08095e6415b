#pragma once

#include "RedirectablePrint.h"

/**
 * The process-wide log console. Writes to stdout unless redirected.
 */
class Console : public RedirectablePrint
{
  public:
    Console();
};

void consoleInit();

extern Console *console;
