#ifndef INTERRUPTGUARD_H
#define INTERRUPTGUARD_H

// Captura Ctrl+C / SIGTERM y deja una marca que consulta el driver.
// La primera señal solo marca la interrupción; la segunda termina el proceso.
class InterruptGuard
{
public:
    static bool install();
    static bool isInterrupted();
    static void reset();

    // Solo para pruebas: simula la llegada de la señal
    static void raiseForTesting();
};

#endif // INTERRUPTGUARD_H
