#pragma once

/**
 * Interface allowing the game loops to pause for a given amount of time. On
 * the emulator this puts the thread to sleep. Tests can provide an
 * implementation that returns immediately.
 */
class DelayProvider
{
      public:
        virtual void delay_ms(int ms) = 0;
        virtual ~DelayProvider() = default;
};
