#include "interruptguard.h"
#include <QDebug>
#include <csignal>

namespace {

volatile std::sig_atomic_t interruptRequested = 0;

extern "C" void onInterruptSignal(int signalNumber)
{
    interruptRequested = 1;
    // Una segunda señal ya no se intercepta
    std::signal(signalNumber, SIG_DFL);
}

} // namespace

bool InterruptGuard::install()
{
    interruptRequested = 0;

#ifdef Q_OS_WIN
    if (std::signal(SIGINT, onInterruptSignal) == SIG_ERR
        || std::signal(SIGTERM, onInterruptSignal) == SIG_ERR) {
        qWarning() << "No se pudo instalar el manejador de interrupciones";
        return false;
    }
#else
    // Sin SA_RESTART: una lectura bloqueante de consola vuelve al recibir la señal
    struct sigaction action;
    action.sa_handler = onInterruptSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    if (sigaction(SIGINT, &action, nullptr) != 0 || sigaction(SIGTERM, &action, nullptr) != 0) {
        qWarning() << "No se pudo instalar el manejador de interrupciones";
        return false;
    }
#endif

    qDebug() << "Manejador de interrupciones instalado";
    return true;
}

bool InterruptGuard::isInterrupted()
{
    return interruptRequested != 0;
}

void InterruptGuard::reset()
{
    interruptRequested = 0;
}

void InterruptGuard::raiseForTesting()
{
    interruptRequested = 1;
}
