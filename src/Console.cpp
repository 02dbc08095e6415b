#include "Console.h"
#include "configuration.h"

Console *console;

void consoleInit()
{
    if (console)
        return;
    new Console(); // registers itself as the global console, lives until exit
}

Console::Console() : RedirectablePrint(stdout)
{
    console = this;
}
