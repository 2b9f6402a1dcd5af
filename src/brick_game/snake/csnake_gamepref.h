#ifndef CSNAKE_GAMEPREF_H
#define CSNAKE_GAMEPREF_H

/*
    Размеры игрового поля по умолчанию (в клетках).
*/
#define CSNAKE_FIELD_COLS 20
#define CSNAKE_FIELD_ROWS 20

/*
    Допустимые границы размеров поля для SnakeConfig_t.
    Верхняя граница ограничена размером терминала в CLI-интерфейсе.
*/
#define CSNAKE_MIN_FIELD_SIDE 4
#define CSNAKE_MAX_FIELD_SIDE 64

/*
    Длина змейки при старте. Голова стоит в центре поля,
    тело вытянуто влево.
*/
#define CSNAKE_INITIAL_LENGTH 3

/*
    Длительность тика: 15 тиков в секунду.
*/
#define CSNAKE_TICKS_PER_SECOND 15
#define CSNAKE_TICK_MS (1000 / CSNAKE_TICKS_PER_SECOND)

#endif
