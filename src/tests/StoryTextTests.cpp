// SPDX-License-Identifier: Apache-2.0
#include <story/StoryText.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace storyloom;
using Catch::Approx;

TEST_CASE("cutTrailingSentence drops the unfinished sentence", "[text]")
{
    CHECK(cutTrailingSentence("The door opens. A cold wind") == "The door opens.");
    CHECK(cutTrailingSentence("He says \"Run!\" and then") == "He says \"Run!\"");
    CHECK(cutTrailingSentence("no stop at all") == "no stop at all");
}

TEST_CASE("cutTrailingSentence drops invented actions unless allowed", "[text]")
{
    CHECK(cutTrailingSentence("The troll roars.\n> You run away.") == "The troll roars.");
    CHECK(cutTrailingSentence("The troll roars.\n> You run away.", true) == "The troll roars.\n> You run away.");
    CHECK(cutTrailingSentence("Fine. <|endoftext|>", true) == "Fine.");
}

TEST_CASE("cleanResult normalizes generated text", "[text]")
{
    CHECK(cleanResult("He said \"hello.\" Then") == "He said \"hello\".");
    CHECK(cleanResult("## The *end*.") == " The end.");
    CHECK(cleanResult("One.\n\n\nTwo.") == "One.\nTwo.");
    CHECK(cleanResult("the rest is quiet.") == "the rest is quiet.");
    CHECK(cleanResult("> You look around.").empty());
}

TEST_CASE("toSecondPerson rewrites first-person pronouns", "[text]")
{
    CHECK(toSecondPerson("I open my bag") == "you open your bag");
    CHECK(toSecondPerson("I'm tired and I've had enough") == "you're tired and you've had enough");
    CHECK(toSecondPerson("give me the map, it is mine") == "give you the map, it is yours");
    CHECK(toSecondPerson("I am here") == "you are here");
    CHECK(toSecondPerson("I was lost") == "you were lost");
    CHECK(toSecondPerson("hug myself") == "hug yourself");
    CHECK(toSecondPerson("My sword") == "Your sword");
    CHECK(toSecondPerson("the enemy is nearby") == "the enemy is nearby");
}

TEST_CASE("similarity compares texts", "[text]")
{
    CHECK(similarity("abc", "abc") == Approx(1.0));
    CHECK(similarity("abc", "xyz") == Approx(0.0));
    CHECK(similarity("", "") == Approx(1.0));
    CHECK(similarity("abcd", "abxd") == Approx(0.75));
}

TEST_CASE("playerDied recognizes death phrases", "[text]")
{
    CHECK(playerDied("The dragon breathes fire. You die."));
    CHECK(playerDied("You have been slain by the orc."));
    CHECK(playerDied("You bleed to death."));
    CHECK_FALSE(playerDied("The orc dies."));
    CHECK_FALSE(playerDied("You open the door."));
}

TEST_CASE("playerWon recognizes victory phrases", "[text]")
{
    CHECK(playerWon("You marry the princess and live happily ever after."));
    CHECK(playerWon("You celebrate your victory."));
    CHECK(playerWon("You become a god."));
    CHECK_FALSE(playerWon("You walk home."));
}
